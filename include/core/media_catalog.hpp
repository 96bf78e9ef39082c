#pragma once

#include <atomic>
#include <ctime>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/media_item.hpp"
#include "core/volume.hpp"

class PocoConfigManager;

struct CatalogOptions
{
    std::set<std::string> image_extensions; // lowercase, no dot
    std::set<std::string> video_extensions;
    std::set<std::string> raw_extensions;   // flagged subset, also accepted as photos
    bool follow_symlinks = false;
    bool extract_capture_time = true;
    int checksum_threads = 4;

    static CatalogOptions defaults();
    static CatalogOptions fromConfig(const PocoConfigManager &config);
};

struct ScanWarning
{
    std::string path;
    std::string message;
};

struct ScanStats
{
    size_t files_seen = 0;
    size_t cataloged = 0;
    size_t skipped_unsupported = 0;
    size_t leftovers = 0;
    size_t warnings = 0;

    nlohmann::json toJson() const;
};

using MediaPredicate = std::function<bool(const MediaItem &)>;

enum class SortKey
{
    NAME,
    SIZE,
    TYPE,
    DATE
};

enum class SortOrder
{
    ASCENDING,
    DESCENDING
};

/**
 * @brief Stock filter predicates; combine them with MediaCatalog::filterAll
 */
class MediaFilters
{
public:
    // Inclusive range on capture time
    static MediaPredicate capturedBetween(std::time_t from, std::time_t to);
    // Inclusive range on byte size
    static MediaPredicate sizeBetween(uint64_t min_bytes, uint64_t max_bytes);
    static MediaPredicate ofTypes(const std::set<MediaType> &types);
    // Case-insensitive substring match on the file name
    static MediaPredicate nameContains(const std::string &needle);
    static MediaPredicate rawOnly();
};

/**
 * @brief Enumerates media files on a volume and caches their checksums
 */
class MediaCatalog
{
public:
    using ProgressCallback = std::function<void(size_t files_seen, const std::string &current_path)>;

    explicit MediaCatalog(CatalogOptions options = CatalogOptions::defaults());

    /**
     * @brief Walk the volume root and catalog every supported media file
     *
     * Unsupported files are counted and skipped. Unreadable entries become
     * scan warnings. Temporary transfer files are reported as leftovers and
     * never cataloged.
     * @param volume Volume to scan
     * @param on_progress Optional callback invoked per file seen
     * @return Items ordered by relative path
     */
    MediaItems scan(const Volume &volume, const ProgressCallback &on_progress = nullptr);

    const std::vector<ScanWarning> &warnings() const { return warnings_; }
    const std::vector<std::string> &leftovers() const { return leftovers_; }
    const ScanStats &stats() const { return stats_; }

    static std::optional<MediaItem> find(const MediaItems &items, const std::string &id);

    static MediaItems filter(const MediaItems &items, const MediaPredicate &predicate);
    static MediaItems filterAll(const MediaItems &items, const std::vector<MediaPredicate> &predicates);
    static MediaItems sort(MediaItems items, SortKey key, SortOrder order = SortOrder::ASCENDING);

    /**
     * @brief SHA-256 of the item's content, computed on first request and cached
     * @return Hex digest, or nullopt if the file cannot be read
     */
    std::optional<std::string> checksum(const MediaItem &item);

    /**
     * @brief Compute checksums for many items in parallel
     * @return item id -> hex digest for every readable item
     */
    std::map<std::string, std::string> computeChecksums(const MediaItems &items);

    bool hasCachedChecksum(const MediaItem &item) const;
    void clearChecksumCache();

    /**
     * @brief Delete temporary transfer files abandoned under a directory tree
     * @return Number of files removed
     */
    static size_t discardLeftovers(const std::string &root);

    std::optional<MediaType> classify(const std::string &extension, bool &is_raw) const;

    const CatalogOptions &options() const { return options_; }

private:
    std::optional<MediaItem> makeItem(const Volume &volume, const std::string &absolute_path);
    static std::string cacheKey(const MediaItem &item);

    CatalogOptions options_;
    std::vector<ScanWarning> warnings_;
    std::vector<std::string> leftovers_;
    ScanStats stats_;

    mutable std::mutex checksum_mutex_;
    std::map<std::string, std::string> checksum_cache_;
};
