#include "test_base.hpp"
#include "core/metadata_extractor.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace
{
    struct AsciiTag
    {
        uint16_t tag;
        std::string value;
    };

    // Builds a minimal TIFF block: IFD0 with ASCII tags plus an optional Exif sub-IFD
    class TiffBuilder
    {
    public:
        explicit TiffBuilder(bool little_endian) : little_endian_(little_endian) {}

        std::vector<uint8_t> build(const std::vector<AsciiTag> &ifd0, const std::vector<AsciiTag> &exif)
        {
            bytes_.clear();
            if (little_endian_)
                bytes_ = {'I', 'I'};
            else
                bytes_ = {'M', 'M'};
            put16(42);
            put32(8);

            size_t ifd0_entries = ifd0.size() + (exif.empty() ? 0 : 1);
            size_t ifd0_size = 2 + ifd0_entries * 12 + 4;
            size_t data_offset = 8 + ifd0_size;

            std::vector<uint8_t> data;
            auto placeAscii = [&](const AsciiTag &tag)
            {
                std::string value = tag.value + '\0';
                uint32_t count = static_cast<uint32_t>(value.size());
                put16(tag.tag);
                put16(2);
                put32(count);
                if (count <= 4)
                {
                    for (size_t i = 0; i < 4; ++i)
                        bytes_.push_back(i < value.size() ? static_cast<uint8_t>(value[i]) : 0);
                }
                else
                {
                    put32(static_cast<uint32_t>(data_offset + data.size()));
                    data.insert(data.end(), value.begin(), value.end());
                }
            };

            put16(static_cast<uint16_t>(ifd0_entries));
            for (const auto &tag : ifd0)
                placeAscii(tag);

            size_t exif_pointer_pos = 0;
            if (!exif.empty())
            {
                put16(0x8769);
                put16(4);
                put32(1);
                exif_pointer_pos = bytes_.size();
                put32(0);
            }
            put32(0);
            bytes_.insert(bytes_.end(), data.begin(), data.end());

            if (!exif.empty())
            {
                uint32_t exif_offset = static_cast<uint32_t>(bytes_.size());
                patch32(exif_pointer_pos, exif_offset);

                data.clear();
                data_offset = exif_offset + 2 + exif.size() * 12 + 4;
                put16(static_cast<uint16_t>(exif.size()));
                for (const auto &tag : exif)
                    placeAscii(tag);
                put32(0);
                bytes_.insert(bytes_.end(), data.begin(), data.end());
            }
            return bytes_;
        }

    private:
        void put16(uint16_t v)
        {
            if (little_endian_)
                bytes_.insert(bytes_.end(), {static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>(v >> 8)});
            else
                bytes_.insert(bytes_.end(), {static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v & 0xFF)});
        }

        void put32(uint32_t v)
        {
            bytes_.resize(bytes_.size() + 4);
            patch32(bytes_.size() - 4, v);
        }

        void patch32(size_t pos, uint32_t v)
        {
            for (int i = 0; i < 4; ++i)
            {
                int shift = little_endian_ ? 8 * i : 8 * (3 - i);
                bytes_[pos + i] = static_cast<uint8_t>((v >> shift) & 0xFF);
            }
        }

        bool little_endian_;
        std::vector<uint8_t> bytes_;
    };

    std::string wrapInJpeg(const std::vector<uint8_t> &tiff)
    {
        std::string jpeg = "\xFF\xD8";
        // An APP0 segment before APP1 must be skipped
        jpeg += std::string("\xFF\xE0\x00\x07JFIF\x00", 9);
        size_t length = 2 + 6 + tiff.size();
        jpeg += '\xFF';
        jpeg += '\xE1';
        jpeg += static_cast<char>((length >> 8) & 0xFF);
        jpeg += static_cast<char>(length & 0xFF);
        jpeg += std::string("Exif\0\0", 6);
        jpeg.append(tiff.begin(), tiff.end());
        jpeg += std::string("\xFF\xDA\x00\x02", 4);
        jpeg += std::string(64, '\x55');
        jpeg += "\xFF\xD9";
        return jpeg;
    }
}

class MetadataExtractorTest : public TestBase
{
};

TEST_F(MetadataExtractorTest, ParsesLittleEndianTiffWithExifSubIfd)
{
    auto tiff = TiffBuilder(true).build({{0x010F, "Canon"}, {0x0110, "EOS R5"}, {0x0132, "2024:01:01 00:00:00"}},
                                        {{0x9003, "2024:03:15 10:20:30"}});
    CaptureMetadata meta = MetadataExtractor::parseTiffBlock(tiff.data(), tiff.size());

    ASSERT_TRUE(meta.capture_time.has_value());
    EXPECT_EQ(*meta.capture_time, utc(2024, 3, 15, 10, 20, 30));
    EXPECT_EQ(meta.source, CaptureTimeSource::EXIF);
    EXPECT_EQ(meta.fields["camera_make"], "Canon");
    EXPECT_EQ(meta.fields["camera_model"], "EOS R5");
}

TEST_F(MetadataExtractorTest, FallsBackToDateTimeInBigEndianBlock)
{
    auto tiff = TiffBuilder(false).build({{0x0110, "X-T4"}, {0x0132, "2023:12:31 23:59:58"}}, {});
    CaptureMetadata meta = MetadataExtractor::parseTiffBlock(tiff.data(), tiff.size());

    ASSERT_TRUE(meta.capture_time.has_value());
    EXPECT_EQ(*meta.capture_time, utc(2023, 12, 31, 23, 59, 58));
    EXPECT_EQ(meta.fields["camera_model"], "X-T4");
    EXPECT_EQ(meta.fields.count("camera_make"), 0u);
}

TEST_F(MetadataExtractorTest, UnsetCameraClockIsIgnored)
{
    auto tiff = TiffBuilder(true).build({{0x0132, "0000:00:00 00:00:00"}}, {});
    CaptureMetadata meta = MetadataExtractor::parseTiffBlock(tiff.data(), tiff.size());
    EXPECT_FALSE(meta.capture_time.has_value());
}

TEST_F(MetadataExtractorTest, TruncatedBlockYieldsNothing)
{
    auto tiff = TiffBuilder(true).build({{0x010F, "Canon"}}, {{0x9003, "2024:03:15 10:20:30"}});
    CaptureMetadata meta = MetadataExtractor::parseTiffBlock(tiff.data(), 12);
    EXPECT_FALSE(meta.capture_time.has_value());

    const uint8_t garbage[] = {'X', 'X', 0, 0, 0, 0, 0, 0};
    EXPECT_FALSE(MetadataExtractor::parseTiffBlock(garbage, sizeof(garbage)).capture_time.has_value());
}

TEST_F(MetadataExtractorTest, ReadsExifFromJpegFile)
{
    auto tiff = TiffBuilder(true).build({{0x010F, "NIKON CORPORATION"}, {0x0110, "Z 6"}},
                                        {{0x9003, "2024:03:15 08:00:00"}});
    std::string path = createSourceFile("DCIM/DSC_0001.JPG", wrapInJpeg(tiff));

    CaptureMetadata meta = MetadataExtractor::extract(path, MediaType::PHOTO, false);
    ASSERT_TRUE(meta.capture_time.has_value());
    EXPECT_EQ(*meta.capture_time, utc(2024, 3, 15, 8, 0, 0));
    EXPECT_EQ(meta.source, CaptureTimeSource::EXIF);
    EXPECT_EQ(meta.fields["camera_make"], "NIKON CORPORATION");
}

TEST_F(MetadataExtractorTest, FilesWithoutMetadataReturnEmpty)
{
    std::string jpeg = createSourceFile("plain.jpg", "not really a jpeg");
    EXPECT_FALSE(MetadataExtractor::extract(jpeg, MediaType::PHOTO, false).capture_time.has_value());

    std::string png = createSourceFile("image.png", "\x89PNG");
    EXPECT_FALSE(MetadataExtractor::extract(png, MediaType::PHOTO, false).capture_time.has_value());

    std::string video = createSourceFile("clip.mov", "garbage");
    EXPECT_FALSE(MetadataExtractor::extract(video, MediaType::VIDEO, false).capture_time.has_value());

    std::string raw = createSourceFile("IMG_0001.CR2", "garbage");
    EXPECT_FALSE(MetadataExtractor::extract(raw, MediaType::PHOTO, true).capture_time.has_value());
}

TEST_F(MetadataExtractorTest, ParseExifDateTime)
{
    EXPECT_EQ(MetadataExtractor::parseExifDateTime("2024:03:15 10:20:30"), utc(2024, 3, 15, 10, 20, 30));
    EXPECT_FALSE(MetadataExtractor::parseExifDateTime("2024-03-15").has_value());
    EXPECT_FALSE(MetadataExtractor::parseExifDateTime("2024:13:15 10:20:30").has_value());
}

TEST_F(MetadataExtractorTest, ParseIso8601)
{
    EXPECT_EQ(MetadataExtractor::parseIso8601("2024-03-15T10:20:30Z"), utc(2024, 3, 15, 10, 20, 30));
    EXPECT_EQ(MetadataExtractor::parseIso8601("2024-03-15T10:20:30.000000Z"), utc(2024, 3, 15, 10, 20, 30));
    EXPECT_EQ(MetadataExtractor::parseIso8601("2024-03-15T12:20:30+02:00"), utc(2024, 3, 15, 10, 20, 30));
    EXPECT_EQ(MetadataExtractor::parseIso8601("2024-03-15T05:20:30-0500"), utc(2024, 3, 15, 10, 20, 30));
    EXPECT_FALSE(MetadataExtractor::parseIso8601("yesterday").has_value());
}
