#pragma once

#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include "core/media_types.hpp"

/**
 * @brief Capture information read from a media file's embedded metadata
 */
struct CaptureMetadata
{
    // Wall-clock capture time encoded as seconds since epoch in UTC arithmetic
    std::optional<std::time_t> capture_time;
    CaptureTimeSource source = CaptureTimeSource::MTIME;
    std::map<std::string, std::string> fields; // camera_make, camera_model, ...
};

/**
 * @brief Reads capture timestamps and camera fields without decoding pixels
 *
 * JPEG and TIFF-style EXIF is parsed directly, RAW formats go through LibRaw
 * and videos through libavformat. Every reader returns an empty result on
 * failure; callers fall back to the modification time.
 */
class MetadataExtractor
{
public:
    /**
     * @brief Extract capture metadata for one file
     * @param file_path Absolute path to the file
     * @param type Media type derived from the extension
     * @param is_raw Whether the extension is a RAW format
     * @return Metadata with capture_time unset when nothing could be read
     */
    static CaptureMetadata extract(const std::string &file_path, MediaType type, bool is_raw);

    static CaptureMetadata readExif(const std::string &file_path);
    static CaptureMetadata readRaw(const std::string &file_path);
    static CaptureMetadata readContainer(const std::string &file_path);

    /**
     * @brief Parse a TIFF structured EXIF block ("II*\0" or "MM\0*" header)
     * @param data Pointer to the TIFF header
     * @param length Bytes available from data
     */
    static CaptureMetadata parseTiffBlock(const uint8_t *data, size_t length);

    /**
     * @brief Parse EXIF "YYYY:MM:DD HH:MM:SS" as wall-clock time
     */
    static std::optional<std::time_t> parseExifDateTime(const std::string &value);

    /**
     * @brief Parse ISO 8601 "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]" to a UTC instant
     */
    static std::optional<std::time_t> parseIso8601(const std::string &value);

    /**
     * @brief Convert a UTC instant to wall-clock time in the local zone
     */
    static std::time_t toWallClock(std::time_t utc_instant);
};
