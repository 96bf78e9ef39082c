#include "core/file_utils.hpp"
#include <stdexcept>
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <vector>
#include <set>
#include <utility>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace
{
    std::string toHex(const unsigned char *digest, size_t length)
    {
        std::stringstream ss;
        for (size_t i = 0; i < length; ++i)
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
        return ss.str();
    }
}

// Sha256Hasher implementation
Sha256Hasher::Sha256Hasher() : valid_(true), finalized_(false)
{
    if (SHA256_Init(&ctx_) != 1)
        valid_ = false;
}

bool Sha256Hasher::update(const void *data, size_t length)
{
    if (!valid_ || finalized_)
        return false;
    if (length == 0)
        return true;
    if (SHA256_Update(&ctx_, data, length) != 1)
    {
        valid_ = false;
        return false;
    }
    return true;
}

std::string Sha256Hasher::finalHex()
{
    if (!valid_ || finalized_)
        return "";
    unsigned char hash[SHA256_DIGEST_LENGTH];
    finalized_ = true;
    if (SHA256_Final(hash, &ctx_) != 1)
    {
        valid_ = false;
        return "";
    }
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

// ScopedFd implementation
int ScopedFd::close()
{
    if (fd_ < 0)
        return 0;
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0 ? 0 : errno;
}

void ScopedFd::reset()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive,
                                                               bool follow_symlinks)
{
    return listFilesInternal(dir_path, recursive, follow_symlinks);
}

SimpleObservable<std::string> FileUtils::listFilesInternal(const std::string &dir_path, bool recursive,
                                                           bool follow_symlinks)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive, follow_symlinks](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext, nullptr, follow_symlinks);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            if (entry.is_regular_file())
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext,
                                         WarningHandler onWarning,
                                         bool follow_symlinks)
{
    std::set<std::pair<uint64_t, uint64_t>> visited;

    auto warn = [&](const std::string &path, const std::string &message)
    {
        Logger::warn("Skipping " + path + ": " + message);
        if (onWarning)
            onWarning(path, message);
    };

    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        struct stat dir_st;
        if (stat(current_path.c_str(), &dir_st) != 0)
        {
            warn(current_path.string(), std::strerror(errno));
            return;
        }
        auto key = std::make_pair(static_cast<uint64_t>(dir_st.st_dev), static_cast<uint64_t>(dir_st.st_ino));
        if (!visited.insert(key).second)
        {
            Logger::debug("Directory already visited, not descending again: " + current_path.string());
            return;
        }

        std::error_code ec;
        fs::directory_iterator it(current_path, ec);
        if (ec)
        {
            warn(current_path.string(), ec.message());
            return;
        }
        for (; it != fs::directory_iterator(); it.increment(ec))
        {
            if (ec)
            {
                warn(current_path.string(), ec.message());
                break;
            }
            const auto &entry = *it;
            std::error_code entry_ec;
            bool is_link = entry.is_symlink(entry_ec);
            if (is_link && !follow_symlinks)
                continue;
            if (is_link && !fs::exists(entry.path(), entry_ec))
            {
                warn(entry.path().string(), entry_ec ? entry_ec.message() : "dangling symbolic link");
                continue;
            }

            if (entry.is_regular_file(entry_ec))
            {
                onNext(entry.path().string());
            }
            else if (entry.is_directory(entry_ec))
            {
                scanDirectory(entry.path());
            }
            else if (entry_ec)
            {
                warn(entry.path().string(), entry_ec.message());
            }
        }
    };
    scanDirectory(fs::path(dir_path));
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    auto hash = computeFileHash(file_path, 8192, nullptr);
    return hash ? *hash : "";
}

std::optional<std::string> FileUtils::computeFileHash(const std::string &file_path, size_t chunk_size,
                                                      const ChunkHandler &on_chunk)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    Sha256Hasher hasher;
    if (!hasher.isValid())
        return std::nullopt;
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return std::nullopt;
    std::vector<char> buffer(chunk_size > 0 ? chunk_size : 8192);
    while (file.good())
    {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (!hasher.update(buffer.data(), static_cast<size_t>(bytes_read)))
                return std::nullopt;
            if (on_chunk && !on_chunk(static_cast<size_t>(bytes_read)))
                return std::nullopt;
        }
    }
    if (file.bad())
        return std::nullopt;
    std::string hex = hasher.finalHex();
    if (hex.empty())
        return std::nullopt;
    return hex;
}

// FileMetadata implementation
bool FileMetadata::operator==(const FileMetadata &other) const
{
    return modification_time == other.modification_time &&
           file_size == other.file_size &&
           inode == other.inode &&
           device_id == other.device_id;
}

bool FileMetadata::operator!=(const FileMetadata &other) const
{
    return !(*this == other);
}

std::string FileMetadata::toString() const
{
    std::stringstream ss;
    ss << "FileMetadata{"
       << "path='" << file_path << "', "
       << "mod_time=" << modification_time << ", "
       << "size=" << file_size << ", "
       << "inode=" << inode << ", "
       << "device=" << device_id << "}";
    return ss.str();
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.modification_time = st.st_mtime;
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    metadata.inode = static_cast<uint64_t>(st.st_ino);
    metadata.device_id = static_cast<uint64_t>(st.st_dev);
    return metadata;
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool FileUtils::isTransferTempFile(const std::string &file_path)
{
    const std::string suffix(kTempSuffix);
    std::string name = fs::path(file_path).filename().string();
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string FileUtils::makeTempPath(const std::string &final_path)
{
    fs::path p(final_path);
    return (p.parent_path() / ("." + p.filename().string() + kTempSuffix)).string();
}

std::string FileUtils::sanitizePathSegment(const std::string &segment)
{
    std::string result;
    result.reserve(segment.size());
    for (unsigned char c : segment)
    {
        if (c < 0x20 || c == 0x7f)
            continue;
        switch (c)
        {
        case '/':
        case '\\':
        case ':':
        case '*':
        case '?':
        case '"':
        case '<':
        case '>':
        case '|':
            result += '_';
            break;
        default:
            result += static_cast<char>(c);
        }
    }
    // Trim surrounding whitespace and dots so "." and ".." never appear
    size_t start = result.find_first_not_of(" .");
    if (start == std::string::npos)
        return "";
    size_t end = result.find_last_not_of(' ');
    return result.substr(start, end - start + 1);
}

bool FileUtils::ensureDirectory(const std::string &dir_path, std::string &error_message)
{
    std::error_code ec;
    fs::create_directories(dir_path, ec);
    if (fs::is_directory(dir_path))
        return true;
    error_message = ec ? ec.message() : "not a directory";
    return false;
}

std::string FileUtils::formatBytes(uint64_t bytes)
{
    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4)
    {
        value /= 1024.0;
        ++unit;
    }
    std::stringstream ss;
    if (unit == 0)
        ss << bytes << " B";
    else
        ss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return ss.str();
}
