#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <openssl/sha.h>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

    void subscribe(Observer onNext)
    {
        subscribe(onNext, nullptr, nullptr);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief File metadata gathered from a single stat call (no content reads)
 */
struct FileMetadata
{
    std::string file_path;
    std::time_t modification_time; // Last modification time
    uint64_t file_size;            // File size in bytes
    uint64_t inode;                // Inode number (for loop and hard link detection)
    uint64_t device_id;            // Device ID

    bool operator==(const FileMetadata &other) const;
    bool operator!=(const FileMetadata &other) const;

    std::string toString() const;
};

/**
 * @brief Incremental SHA-256 over OpenSSL's SHA256_CTX
 */
class Sha256Hasher
{
public:
    Sha256Hasher();

    bool update(const void *data, size_t length);
    std::string finalHex();
    bool isValid() const { return valid_; }

private:
    SHA256_CTX ctx_;
    bool valid_;
    bool finalized_;
};

/**
 * @brief Owns a POSIX file descriptor and closes it on scope exit
 */
class ScopedFd
{
public:
    ScopedFd() : fd_(-1) {}
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;

    ScopedFd(ScopedFd &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    ScopedFd &operator=(ScopedFd &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Closes the descriptor and returns close(2)'s errno, 0 on success
    int close();
    void reset();

private:
    int fd_;
};

/**
 * @brief File utilities for efficient file operations
 */
class FileUtils
{
public:
    // Suffix marking in-flight copies; leftovers with it are safe to discard
    static constexpr const char *kTempSuffix = ".mtx_tmp";

    using WarningHandler = std::function<void(const std::string &path, const std::string &message)>;
    using ChunkHandler = std::function<bool(size_t bytes_read)>;

    /**
     * @brief Get file metadata efficiently (no file content reading)
     * @param file_path Path to the file
     * @return Optional FileMetadata if file exists and is accessible
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * Lists all regular files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @param follow_symlinks Whether symlinked directories are descended into
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false,
                                                               bool follow_symlinks = false);

    /**
     * Scans a directory recursively and calls the provided function for each file.
     * Every directory is identified by (device, inode) and visited at most once,
     * so symlink loops are never followed twice.
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     * @param onWarning Function to call for each unreadable entry
     * @param follow_symlinks Whether symlinked directories are descended into
     */
    static void scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext,
                                         WarningHandler onWarning = nullptr,
                                         bool follow_symlinks = false);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * Computes SHA256 hash of a file
     * @param file_path Path to the file
     * @return SHA256 hash as hexadecimal string, empty on failure
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * Computes SHA256 hash of a file chunk by chunk
     * @param file_path Path to the file
     * @param chunk_size Read size per chunk
     * @param on_chunk Called after each chunk; returning false aborts the hash
     * @return Hex digest, or nullopt on read failure or abort
     */
    static std::optional<std::string> computeFileHash(const std::string &file_path, size_t chunk_size,
                                                      const ChunkHandler &on_chunk);

    /**
     * @brief Lowercase extension without the dot, empty when absent
     */
    static std::string getFileExtension(const std::string &file_path);

    static bool isTransferTempFile(const std::string &file_path);

    /**
     * @brief Hidden temporary sibling of a destination file
     * @param final_path Planned destination path
     * @return e.g. "/dst/2024/03/.IMG0001.jpg.mtx_tmp"
     */
    static std::string makeTempPath(const std::string &final_path);

    /**
     * @brief Replace characters that are invalid in a folder or file name
     * @return Sanitized segment, empty if nothing printable remains
     */
    static std::string sanitizePathSegment(const std::string &segment);

    /**
     * @brief Create a directory tree, tolerating concurrent creators
     * @return true if the directory exists afterwards
     */
    static bool ensureDirectory(const std::string &dir_path, std::string &error_message);

    /**
     * @brief Human readable size, e.g. "3.2 MB"
     */
    static std::string formatBytes(uint64_t bytes);

private:
    static SimpleObservable<std::string> listFilesInternal(const std::string &dir_path, bool recursive,
                                                           bool follow_symlinks);
};
