#include "core/media_catalog.hpp"
#include "core/file_utils.hpp"
#include "core/metadata_extractor.hpp"
#include "core/poco_config_manager.hpp"
#include "core/transfer_errors.hpp"
#include "logging/logger.hpp"
#include <unistd.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

namespace
{
    std::string twoDigits(int value)
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d", value);
        return buf;
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::set<std::string> toSet(const std::vector<std::string> &values)
    {
        return std::set<std::string>(values.begin(), values.end());
    }

    std::set<std::string> enabledExtensions(const nlohmann::json &config, const std::string &category)
    {
        std::set<std::string> extensions;
        if (!config.contains("categories") || !config["categories"].contains(category))
            return extensions;
        for (auto it = config["categories"][category].begin(); it != config["categories"][category].end(); ++it)
        {
            if (it.value().is_boolean() && it.value().get<bool>())
                extensions.insert(toLower(it.key()));
        }
        return extensions;
    }
}

nlohmann::json MediaItem::toJson() const
{
    nlohmann::json j;
    j["id"] = id;
    j["relative_path"] = relative_path;
    j["absolute_path"] = absolute_path;
    j["file_name"] = file_name;
    j["extension"] = extension;
    j["size"] = size;
    j["modification_time"] = modification_time;
    j["capture_time"] = capture_time;
    j["capture_time_source"] = MediaTypes::getCaptureSourceName(capture_time_source);
    j["type"] = MediaTypes::getMediaTypeName(type);
    j["is_raw"] = is_raw;
    j["volume_id"] = volume_id;
    j["metadata"] = metadata;
    return j;
}

nlohmann::json ScanStats::toJson() const
{
    return {{"files_seen", files_seen},
            {"cataloged", cataloged},
            {"skipped_unsupported", skipped_unsupported},
            {"leftovers", leftovers},
            {"warnings", warnings}};
}

CatalogOptions CatalogOptions::defaults()
{
    nlohmann::json config = PocoConfigManager::defaultConfig();
    CatalogOptions options;
    options.image_extensions = enabledExtensions(config, "images");
    options.video_extensions = enabledExtensions(config, "video");
    options.raw_extensions = enabledExtensions(config, "raw");
    options.follow_symlinks = config["catalog"]["follow_symlinks"].get<bool>();
    options.extract_capture_time = config["catalog"]["extract_capture_time"].get<bool>();
    options.checksum_threads = config["catalog"]["checksum_threads"].get<int>();
    return options;
}

CatalogOptions CatalogOptions::fromConfig(const PocoConfigManager &config)
{
    CatalogOptions options;
    options.image_extensions = toSet(config.getEnabledImageExtensions());
    options.video_extensions = toSet(config.getEnabledVideoExtensions());
    options.raw_extensions = toSet(config.getEnabledRawExtensions());
    options.follow_symlinks = config.getBool("catalog.follow_symlinks", false);
    options.extract_capture_time = config.getBool("catalog.extract_capture_time", true);
    options.checksum_threads = std::max(1, config.getInt("catalog.checksum_threads", 4));
    return options;
}

// Filters
MediaPredicate MediaFilters::capturedBetween(std::time_t from, std::time_t to)
{
    return [from, to](const MediaItem &item)
    { return item.capture_time >= from && item.capture_time <= to; };
}

MediaPredicate MediaFilters::sizeBetween(uint64_t min_bytes, uint64_t max_bytes)
{
    return [min_bytes, max_bytes](const MediaItem &item)
    { return item.size >= min_bytes && item.size <= max_bytes; };
}

MediaPredicate MediaFilters::ofTypes(const std::set<MediaType> &types)
{
    return [types](const MediaItem &item)
    { return types.count(item.type) > 0; };
}

MediaPredicate MediaFilters::nameContains(const std::string &needle)
{
    std::string lowered = toLower(needle);
    return [lowered](const MediaItem &item)
    { return toLower(item.file_name).find(lowered) != std::string::npos; };
}

MediaPredicate MediaFilters::rawOnly()
{
    return [](const MediaItem &item)
    { return item.is_raw; };
}

// MediaCatalog
MediaCatalog::MediaCatalog(CatalogOptions options) : options_(std::move(options))
{
}

std::optional<MediaType> MediaCatalog::classify(const std::string &extension, bool &is_raw) const
{
    std::string ext = toLower(extension);
    is_raw = options_.raw_extensions.count(ext) > 0;
    if (is_raw || options_.image_extensions.count(ext))
        return MediaType::PHOTO;
    if (options_.video_extensions.count(ext))
        return MediaType::VIDEO;
    return std::nullopt;
}

MediaItems MediaCatalog::scan(const Volume &volume, const ProgressCallback &on_progress)
{
    warnings_.clear();
    leftovers_.clear();
    stats_ = ScanStats{};

    if (!FileUtils::isValidDirectory(volume.root_path))
    {
        Logger::error("Cannot scan volume, root is not accessible: " + volume.root_path);
        throw VolumeUnavailableError("Volume root not accessible: " + volume.root_path);
    }

    Logger::info("Scanning volume " + volume.root_path);
    MediaItems items;

    FileUtils::scanDirectoryRecursively(
        volume.root_path,
        [&](const std::string &path)
        {
            ++stats_.files_seen;
            if (on_progress)
                on_progress(stats_.files_seen, path);

            if (FileUtils::isTransferTempFile(path))
            {
                Logger::debug("Found leftover temporary file: " + path);
                leftovers_.push_back(path);
                ++stats_.leftovers;
                return;
            }

            auto item = makeItem(volume, path);
            if (item)
            {
                items.push_back(std::move(*item));
                ++stats_.cataloged;
            }
        },
        [&](const std::string &path, const std::string &message)
        {
            warnings_.push_back(ScanWarning{path, message});
            ++stats_.warnings;
        },
        options_.follow_symlinks);

    std::sort(items.begin(), items.end(),
              [](const MediaItem &a, const MediaItem &b)
              { return a.relative_path < b.relative_path; });

    Logger::info("Scan complete: " + std::to_string(stats_.cataloged) + " media files, " +
                 std::to_string(stats_.skipped_unsupported) + " unsupported, " +
                 std::to_string(stats_.leftovers) + " leftovers, " +
                 std::to_string(stats_.warnings) + " warnings");
    return items;
}

std::optional<MediaItem> MediaCatalog::makeItem(const Volume &volume, const std::string &absolute_path)
{
    std::string extension = FileUtils::getFileExtension(absolute_path);
    bool is_raw = false;
    auto type = classify(extension, is_raw);
    if (!type)
    {
        ++stats_.skipped_unsupported;
        return std::nullopt;
    }

    auto file_meta = FileUtils::getFileMetadata(absolute_path);
    if (!file_meta)
    {
        warnings_.push_back(ScanWarning{absolute_path, "cannot stat file"});
        ++stats_.warnings;
        Logger::warn("Skipping unreadable file: " + absolute_path);
        return std::nullopt;
    }
    if (::access(absolute_path.c_str(), R_OK) != 0)
    {
        std::string reason = std::strerror(errno);
        warnings_.push_back(ScanWarning{absolute_path, "cannot read file: " + reason});
        ++stats_.warnings;
        Logger::warn("Skipping unreadable file: " + absolute_path + " (" + reason + ")");
        return std::nullopt;
    }

    fs::path abs(absolute_path);
    fs::path relative = abs.lexically_relative(fs::path(volume.root_path));

    MediaItem item;
    item.relative_path = relative.generic_string();
    item.id = item.relative_path;
    item.absolute_path = absolute_path;
    item.file_name = abs.filename().string();
    item.extension = extension;
    item.size = file_meta->file_size;
    item.modification_time = file_meta->modification_time;
    item.type = *type;
    item.is_raw = is_raw;
    item.volume_id = volume.id;

    CaptureMetadata capture;
    if (options_.extract_capture_time)
        capture = MetadataExtractor::extract(absolute_path, item.type, item.is_raw);
    if (capture.capture_time)
    {
        item.capture_time = *capture.capture_time;
        item.capture_time_source = capture.source;
    }
    else
    {
        item.capture_time = MetadataExtractor::toWallClock(item.modification_time);
        item.capture_time_source = CaptureTimeSource::MTIME;
    }

    std::tm tm{};
    gmtime_r(&item.capture_time, &tm);
    item.metadata = capture.fields;
    item.metadata["year"] = std::to_string(tm.tm_year + 1900);
    item.metadata["month"] = twoDigits(tm.tm_mon + 1);
    item.metadata["day"] = twoDigits(tm.tm_mday);
    item.metadata["hour"] = twoDigits(tm.tm_hour);
    item.metadata["minute"] = twoDigits(tm.tm_min);
    item.metadata["second"] = twoDigits(tm.tm_sec);
    item.metadata["date"] = item.metadata["year"] + "-" + item.metadata["month"] + "-" + item.metadata["day"];
    item.metadata["media_type"] = MediaTypes::getMediaTypeName(item.type);
    item.metadata["extension"] = item.extension;
    item.metadata["file_name"] = item.file_name;
    item.metadata["original_name"] = abs.stem().string();
    item.metadata["capture_source"] = MediaTypes::getCaptureSourceName(item.capture_time_source);
    item.metadata["volume_id"] = volume.id;
    if (!volume.label.empty())
        item.metadata["volume_label"] = volume.label;
    std::string folder = relative.parent_path().filename().string();
    if (!folder.empty())
        item.metadata["source_folder"] = folder;

    Logger::trace("Cataloged " + item.relative_path + " (" + item.metadata["capture_source"] + ")");
    return item;
}

std::optional<MediaItem> MediaCatalog::find(const MediaItems &items, const std::string &id)
{
    for (const auto &item : items)
    {
        if (item.id == id)
            return item;
    }
    return std::nullopt;
}

MediaItems MediaCatalog::filter(const MediaItems &items, const MediaPredicate &predicate)
{
    MediaItems result;
    std::copy_if(items.begin(), items.end(), std::back_inserter(result), predicate);
    return result;
}

MediaItems MediaCatalog::filterAll(const MediaItems &items, const std::vector<MediaPredicate> &predicates)
{
    return filter(items, [&predicates](const MediaItem &item)
                  {
        for (const auto &predicate : predicates)
        {
            if (!predicate(item))
                return false;
        }
        return true; });
}

MediaItems MediaCatalog::sort(MediaItems items, SortKey key, SortOrder order)
{
    auto less = [key](const MediaItem &a, const MediaItem &b)
    {
        switch (key)
        {
        case SortKey::SIZE:
            if (a.size != b.size)
                return a.size < b.size;
            break;
        case SortKey::TYPE:
            if (a.type != b.type)
                return MediaTypes::getMediaTypeName(a.type) < MediaTypes::getMediaTypeName(b.type);
            break;
        case SortKey::DATE:
            if (a.capture_time != b.capture_time)
                return a.capture_time < b.capture_time;
            break;
        case SortKey::NAME:
            break;
        }
        std::string name_a = toLower(a.file_name);
        std::string name_b = toLower(b.file_name);
        if (name_a != name_b)
            return name_a < name_b;
        return a.relative_path < b.relative_path;
    };

    if (order == SortOrder::ASCENDING)
        std::stable_sort(items.begin(), items.end(), less);
    else
        std::stable_sort(items.begin(), items.end(),
                         [&less](const MediaItem &a, const MediaItem &b)
                         { return less(b, a); });
    return items;
}

std::string MediaCatalog::cacheKey(const MediaItem &item)
{
    return item.absolute_path + "|" + std::to_string(item.size) + "|" + std::to_string(item.modification_time);
}

std::optional<std::string> MediaCatalog::checksum(const MediaItem &item)
{
    const std::string key = cacheKey(item);
    {
        std::lock_guard<std::mutex> lock(checksum_mutex_);
        auto it = checksum_cache_.find(key);
        if (it != checksum_cache_.end())
            return it->second;
    }

    std::string hash = FileUtils::computeFileHash(item.absolute_path);
    if (hash.empty())
    {
        Logger::warn("Failed to compute checksum for " + item.absolute_path);
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(checksum_mutex_);
    checksum_cache_[key] = hash;
    return hash;
}

std::map<std::string, std::string> MediaCatalog::computeChecksums(const MediaItems &items)
{
    std::vector<std::optional<std::string>> results(items.size());
    tbb::task_arena arena(std::max(1, options_.checksum_threads));
    arena.execute([&]
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, items.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              results[i] = checksum(items[i]);
                                          }
                                      }); });

    std::map<std::string, std::string> checksums;
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (results[i])
            checksums[items[i].id] = *results[i];
    }
    Logger::debug("Computed " + std::to_string(checksums.size()) + "/" + std::to_string(items.size()) + " checksums");
    return checksums;
}

bool MediaCatalog::hasCachedChecksum(const MediaItem &item) const
{
    std::lock_guard<std::mutex> lock(checksum_mutex_);
    return checksum_cache_.count(cacheKey(item)) > 0;
}

void MediaCatalog::clearChecksumCache()
{
    std::lock_guard<std::mutex> lock(checksum_mutex_);
    checksum_cache_.clear();
}

size_t MediaCatalog::discardLeftovers(const std::string &root)
{
    if (!FileUtils::isValidDirectory(root))
        return 0;

    size_t removed = 0;
    FileUtils::scanDirectoryRecursively(root, [&](const std::string &path)
                                        {
        if (!FileUtils::isTransferTempFile(path))
            return;
        std::error_code ec;
        if (fs::remove(path, ec))
        {
            ++removed;
            Logger::info("Removed leftover temporary file: " + path);
        }
        else if (ec)
        {
            Logger::warn("Could not remove leftover " + path + ": " + ec.message());
        } });
    return removed;
}
