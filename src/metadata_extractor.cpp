#include "core/metadata_extractor.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <set>
#include <vector>

namespace
{
    // EXIF headers live in the first segments; no need to read pixel data
    constexpr size_t kMaxHeaderBytes = 256 * 1024;

    constexpr uint16_t kTagMake = 0x010F;
    constexpr uint16_t kTagModel = 0x0110;
    constexpr uint16_t kTagDateTime = 0x0132;
    constexpr uint16_t kTagExifIfd = 0x8769;
    constexpr uint16_t kTagDateTimeOriginal = 0x9003;
    constexpr uint16_t kTagDateTimeDigitized = 0x9004;

    constexpr uint16_t kTypeAscii = 2;
    constexpr uint16_t kTypeLong = 4;

    class TiffReader
    {
    public:
        TiffReader(const uint8_t *data, size_t length, bool little_endian)
            : data_(data), length_(length), little_endian_(little_endian) {}

        bool read16(size_t offset, uint16_t &out) const
        {
            if (offset + 2 > length_)
                return false;
            if (little_endian_)
                out = static_cast<uint16_t>(data_[offset] | (data_[offset + 1] << 8));
            else
                out = static_cast<uint16_t>((data_[offset] << 8) | data_[offset + 1]);
            return true;
        }

        bool read32(size_t offset, uint32_t &out) const
        {
            if (offset + 4 > length_)
                return false;
            const uint8_t *p = data_ + offset;
            if (little_endian_)
                out = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                      (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
            else
                out = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                      (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
            return true;
        }

        // ASCII values of four bytes or less are stored inline in the entry
        std::string readAscii(size_t entry_offset, uint32_t count) const
        {
            size_t value_offset = entry_offset + 8;
            if (count > 4)
            {
                uint32_t ptr = 0;
                if (!read32(entry_offset + 8, ptr))
                    return "";
                value_offset = ptr;
            }
            if (count == 0 || value_offset >= length_ || value_offset + count > length_)
                return "";
            std::string value(reinterpret_cast<const char *>(data_ + value_offset), count);
            size_t end = value.find('\0');
            if (end != std::string::npos)
                value.resize(end);
            size_t last = value.find_last_not_of(' ');
            return last == std::string::npos ? "" : value.substr(0, last + 1);
        }

    private:
        const uint8_t *data_;
        size_t length_;
        bool little_endian_;
    };

    struct ParsedIso
    {
        std::time_t civil;   // components interpreted in UTC arithmetic
        long offset_seconds; // zone offset, 0 when absent or "Z"
        bool has_offset;
    };

    std::optional<ParsedIso> parseIsoComponents(const std::string &value)
    {
        int year, month, day, hour, minute, second;
        char sep = 0;
        int consumed = 0;
        if (std::sscanf(value.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                        &year, &month, &day, &sep, &hour, &minute, &second, &consumed) != 7)
            return std::nullopt;
        if ((sep != 'T' && sep != ' ') || year < 1900 || month < 1 || month > 12 || day < 1 || day > 31)
            return std::nullopt;

        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;

        ParsedIso parsed{timegm(&tm), 0, false};

        size_t pos = static_cast<size_t>(consumed);
        if (pos < value.size() && value[pos] == '.')
        {
            ++pos;
            while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])))
                ++pos;
        }
        if (pos < value.size())
        {
            char zone = value[pos];
            if (zone == 'Z')
            {
                parsed.has_offset = true;
            }
            else if (zone == '+' || zone == '-')
            {
                int oh = 0, om = 0;
                std::string rest = value.substr(pos + 1);
                if (std::sscanf(rest.c_str(), "%2d:%2d", &oh, &om) == 2 ||
                    std::sscanf(rest.c_str(), "%2d%2d", &oh, &om) == 2 ||
                    std::sscanf(rest.c_str(), "%2d", &oh) == 1)
                {
                    parsed.offset_seconds = (zone == '-' ? -1 : 1) * (oh * 3600L + om * 60L);
                    parsed.has_offset = true;
                }
            }
        }
        return parsed;
    }

    std::string dictValue(AVDictionary *dict, const char *key)
    {
        AVDictionaryEntry *entry = av_dict_get(dict, key, nullptr, 0);
        return entry && entry->value ? std::string(entry->value) : "";
    }

    void setField(CaptureMetadata &meta, const std::string &key, const std::string &value)
    {
        if (!value.empty())
            meta.fields[key] = value;
    }
}

CaptureMetadata MetadataExtractor::extract(const std::string &file_path, MediaType type, bool is_raw)
{
    if (is_raw)
    {
        CaptureMetadata raw = readRaw(file_path);
        if (raw.capture_time)
            return raw;
        // Most RAW formats are TIFF based and carry plain EXIF as well
        CaptureMetadata exif = readExif(file_path);
        if (exif.capture_time)
        {
            for (const auto &field : raw.fields)
                exif.fields.emplace(field.first, field.second);
            return exif;
        }
        return raw;
    }

    if (type == MediaType::PHOTO)
    {
        static const std::set<std::string> exif_extensions = {"jpg", "jpeg", "jpe", "jfif", "tif", "tiff"};
        if (exif_extensions.count(FileUtils::getFileExtension(file_path)))
            return readExif(file_path);
        return CaptureMetadata{};
    }

    if (type == MediaType::VIDEO)
        return readContainer(file_path);

    return CaptureMetadata{};
}

CaptureMetadata MetadataExtractor::readExif(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        Logger::debug("Cannot open file for EXIF read: " + file_path);
        return CaptureMetadata{};
    }
    std::vector<uint8_t> buffer(kMaxHeaderBytes);
    file.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    size_t length = static_cast<size_t>(file.gcount());
    const uint8_t *data = buffer.data();

    if (length >= 4 && (std::memcmp(data, "II*\0", 4) == 0 || std::memcmp(data, "MM\0*", 4) == 0))
        return parseTiffBlock(data, length);

    if (length < 4 || data[0] != 0xFF || data[1] != 0xD8)
        return CaptureMetadata{};

    size_t pos = 2;
    while (pos + 4 <= length)
    {
        if (data[pos] != 0xFF)
            break;
        uint8_t marker = data[pos + 1];
        if (marker == 0xFF)
        {
            ++pos;
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA)
            break;
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01)
        {
            pos += 2;
            continue;
        }
        size_t segment_length = (static_cast<size_t>(data[pos + 2]) << 8) | data[pos + 3];
        if (segment_length < 2)
            break;
        if (marker == 0xE1 && segment_length >= 8 && pos + 10 <= length &&
            std::memcmp(data + pos + 4, "Exif\0\0", 6) == 0)
        {
            size_t start = pos + 10;
            size_t available = std::min(segment_length - 8, length - start);
            return parseTiffBlock(data + start, available);
        }
        pos += 2 + segment_length;
    }
    return CaptureMetadata{};
}

CaptureMetadata MetadataExtractor::parseTiffBlock(const uint8_t *data, size_t length)
{
    CaptureMetadata meta;
    if (length < 8)
        return meta;

    bool little_endian;
    if (data[0] == 'I' && data[1] == 'I')
        little_endian = true;
    else if (data[0] == 'M' && data[1] == 'M')
        little_endian = false;
    else
        return meta;

    TiffReader reader(data, length, little_endian);
    uint16_t magic = 0;
    uint32_t ifd0 = 0;
    if (!reader.read16(2, magic) || magic != 42 || !reader.read32(4, ifd0))
        return meta;

    std::map<uint16_t, std::string> values;
    uint32_t exif_ifd = 0;

    auto readIfd = [&](uint32_t ifd_offset, bool primary)
    {
        uint16_t count = 0;
        if (!reader.read16(ifd_offset, count))
            return;
        for (uint16_t i = 0; i < count; ++i)
        {
            size_t entry = ifd_offset + 2 + static_cast<size_t>(i) * 12;
            uint16_t tag = 0, type = 0;
            uint32_t n = 0;
            if (!reader.read16(entry, tag) || !reader.read16(entry + 2, type) || !reader.read32(entry + 4, n))
                return;
            if (primary && tag == kTagExifIfd && type == kTypeLong)
            {
                reader.read32(entry + 8, exif_ifd);
            }
            else if (type == kTypeAscii &&
                     (tag == kTagMake || tag == kTagModel || tag == kTagDateTime ||
                      tag == kTagDateTimeOriginal || tag == kTagDateTimeDigitized))
            {
                values[tag] = reader.readAscii(entry, n);
            }
        }
    };

    readIfd(ifd0, true);
    if (exif_ifd != 0 && exif_ifd != ifd0)
        readIfd(exif_ifd, false);

    setField(meta, "camera_make", values[kTagMake]);
    setField(meta, "camera_model", values[kTagModel]);

    for (uint16_t tag : {kTagDateTimeOriginal, kTagDateTimeDigitized, kTagDateTime})
    {
        auto parsed = parseExifDateTime(values[tag]);
        if (parsed)
        {
            meta.capture_time = parsed;
            meta.source = CaptureTimeSource::EXIF;
            break;
        }
    }
    return meta;
}

CaptureMetadata MetadataExtractor::readRaw(const std::string &file_path)
{
    CaptureMetadata meta;
    LibRawMetadataRAII raw;
    int rc = raw.open(file_path);
    if (rc != LIBRAW_SUCCESS)
    {
        Logger::debug("LibRaw could not open " + file_path + ": " + libraw_strerror(rc));
        return meta;
    }

    LibRaw *processor = raw.get();
    setField(meta, "camera_make", processor->imgdata.idata.make);
    setField(meta, "camera_model", processor->imgdata.idata.model);

    std::time_t timestamp = processor->imgdata.other.timestamp;
    if (timestamp > 0)
    {
        meta.capture_time = toWallClock(timestamp);
        meta.source = CaptureTimeSource::RAW;
    }
    return meta;
}

CaptureMetadata MetadataExtractor::readContainer(const std::string &file_path)
{
    CaptureMetadata meta;
    av_log_set_level(AV_LOG_QUIET);

    AVFormatInputRAII input;
    int rc = avformat_open_input(input.address(), file_path.c_str(), nullptr, nullptr);
    if (rc < 0)
    {
        char err[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(rc, err, sizeof(err));
        Logger::debug("FFmpeg could not open " + file_path + ": " + err);
        return meta;
    }

    AVDictionary *tags = input.get()->metadata;
    std::string make = dictValue(tags, "com.apple.quicktime.make");
    if (make.empty())
        make = dictValue(tags, "make");
    std::string model = dictValue(tags, "com.apple.quicktime.model");
    if (model.empty())
        model = dictValue(tags, "model");
    setField(meta, "camera_make", make);
    setField(meta, "camera_model", model);

    // QuickTime creationdate carries the camera's local time plus its offset
    auto local = parseIsoComponents(dictValue(tags, "com.apple.quicktime.creationdate"));
    if (local)
    {
        meta.capture_time = local->civil;
        meta.source = CaptureTimeSource::CONTAINER;
        return meta;
    }

    auto utc = parseIso8601(dictValue(tags, "creation_time"));
    if (utc && *utc > 0)
    {
        meta.capture_time = toWallClock(*utc);
        meta.source = CaptureTimeSource::CONTAINER;
    }
    return meta;
}

std::optional<std::time_t> MetadataExtractor::parseExifDateTime(const std::string &value)
{
    int year, month, day, hour, minute, second;
    if (std::sscanf(value.c_str(), "%4d:%2d:%2d %2d:%2d:%2d", &year, &month, &day, &hour, &minute, &second) != 6)
        return std::nullopt;
    // Cameras without a set clock write "0000:00:00 00:00:00"
    if (year < 1900 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return timegm(&tm);
}

std::optional<std::time_t> MetadataExtractor::parseIso8601(const std::string &value)
{
    auto parsed = parseIsoComponents(value);
    if (!parsed)
        return std::nullopt;
    return parsed->civil - parsed->offset_seconds;
}

std::time_t MetadataExtractor::toWallClock(std::time_t utc_instant)
{
    std::tm local{};
    if (!localtime_r(&utc_instant, &local))
        return utc_instant;
    return timegm(&local);
}
