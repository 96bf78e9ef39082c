#pragma once

#include <cstdint>
#include <ctime>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/media_types.hpp"

/**
 * @brief One cataloged media file on a volume. Immutable once created.
 *
 * The content checksum is not part of the item; it is computed on demand
 * and cached by MediaCatalog.
 */
struct MediaItem
{
    std::string id;                 // volume-relative generic path, unique within a scan
    std::string relative_path;      // e.g. "DCIM/100CANON/IMG_1234.JPG"
    std::string absolute_path;
    std::string file_name;          // e.g. "IMG_1234.JPG"
    std::string extension;          // lowercase, no dot
    uint64_t size = 0;
    std::time_t modification_time = 0;
    std::time_t capture_time = 0;   // wall-clock seconds, UTC arithmetic
    CaptureTimeSource capture_time_source = CaptureTimeSource::MTIME;
    MediaType type = MediaType::OTHER;
    bool is_raw = false;
    std::string volume_id;
    std::map<std::string, std::string> metadata; // field -> value used by templates

    nlohmann::json toJson() const;
};

using MediaItems = std::vector<MediaItem>;
