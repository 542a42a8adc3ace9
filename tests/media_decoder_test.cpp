#include "test_base.hpp"
#include "core/decoder/media_decoder.hpp"
#include <opencv2/core.hpp>

class MediaDecoderTest : public TestBase
{
protected:
    LibraryMediaDecoder decoder_;
};

TEST_F(MediaDecoderTest, ProbesPngHeader)
{
    auto dims = decoder_.probeSize(pngHeader(1080, 1920));
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, (Dimensions{1080, 1920}));
}

TEST_F(MediaDecoderTest, ProbesGifHeader)
{
    std::vector<std::uint8_t> bytes;
    appendText(bytes, "GIF89a");
    appendLe(bytes, 320, 2);
    appendLe(bytes, 568, 2);

    auto dims = decoder_.probeSize(bytes);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, (Dimensions{320, 568}));
}

TEST_F(MediaDecoderTest, ProbesTopDownBmp)
{
    std::vector<std::uint8_t> bytes;
    appendText(bytes, "BM");
    appendLe(bytes, 0, 4);  // file size
    appendLe(bytes, 0, 4);  // reserved
    appendLe(bytes, 54, 4); // pixel offset
    appendLe(bytes, 40, 4); // BITMAPINFOHEADER
    appendLe(bytes, 750, 4);
    appendLe(bytes, static_cast<std::uint32_t>(-1334), 4);

    auto dims = decoder_.probeSize(bytes);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, (Dimensions{750, 1334}));
}

TEST_F(MediaDecoderTest, RejectsBmpWithMinimumHeight)
{
    std::vector<std::uint8_t> bytes;
    appendText(bytes, "BM");
    appendLe(bytes, 0, 4);
    appendLe(bytes, 0, 4);
    appendLe(bytes, 54, 4);
    appendLe(bytes, 40, 4);
    appendLe(bytes, 750, 4);
    appendLe(bytes, 0x80000000u, 4);

    EXPECT_FALSE(decoder_.probeSize(bytes).has_value());
}

TEST_F(MediaDecoderTest, ProbesJpegFrameHeader)
{
    std::vector<std::uint8_t> bytes = {0xFF, 0xD8};
    // APP0 segment to skip
    bytes.insert(bytes.end(), {0xFF, 0xE0});
    appendBe(bytes, 6, 2);
    appendText(bytes, "JFIF");
    // Baseline frame header
    bytes.insert(bytes.end(), {0xFF, 0xC0});
    appendBe(bytes, 17, 2);
    bytes.push_back(8);
    appendBe(bytes, 2340, 2); // height
    appendBe(bytes, 1080, 2); // width
    bytes.push_back(3);

    auto dims = decoder_.probeSize(bytes);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, (Dimensions{1080, 2340}));
}

TEST_F(MediaDecoderTest, JpegWithoutFrameHeaderIsUnknown)
{
    std::vector<std::uint8_t> bytes = {0xFF, 0xD8, 0xFF, 0xDA, 0x00, 0x08};
    EXPECT_FALSE(decoder_.probeSize(bytes).has_value());
}

TEST_F(MediaDecoderTest, ProbesExtendedWebp)
{
    auto dims = decoder_.probeSize(webpHeader(576, 1024));
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, (Dimensions{576, 1024}));
}

TEST_F(MediaDecoderTest, ProbesLosslessWebp)
{
    const std::uint32_t w = 1080 - 1;
    const std::uint32_t h = 1920 - 1;
    std::vector<std::uint8_t> bytes;
    appendText(bytes, "RIFF");
    appendLe(bytes, 22, 4);
    appendText(bytes, "WEBPVP8L");
    appendLe(bytes, 10, 4);
    bytes.push_back(0x2F);
    // 14 bits width, 14 bits height, packed little-endian
    appendLe(bytes, w | (h << 14), 4);
    appendLe(bytes, 0, 5);

    auto dims = decoder_.probeSize(bytes);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, (Dimensions{1080, 1920}));
}

TEST_F(MediaDecoderTest, ProbesLossyWebp)
{
    std::vector<std::uint8_t> bytes;
    appendText(bytes, "RIFF");
    appendLe(bytes, 22, 4);
    appendText(bytes, "WEBPVP8 ");
    appendLe(bytes, 10, 4);
    appendLe(bytes, 0, 3); // frame tag
    bytes.insert(bytes.end(), {0x9D, 0x01, 0x2A});
    appendLe(bytes, 720, 2);
    appendLe(bytes, 1280, 2);

    auto dims = decoder_.probeSize(bytes);
    ASSERT_TRUE(dims.has_value());
    EXPECT_EQ(*dims, (Dimensions{720, 1280}));
}

TEST_F(MediaDecoderTest, GarbageAndTruncatedHeadersAreUnknown)
{
    std::vector<std::uint8_t> garbage;
    appendText(garbage, "definitely not an image header");
    EXPECT_FALSE(decoder_.probeSize(garbage).has_value());
    EXPECT_FALSE(decoder_.probeSize({}).has_value());

    std::vector<std::uint8_t> truncated = pngHeader(10, 10);
    truncated.resize(20);
    EXPECT_FALSE(decoder_.probeSize(truncated).has_value());

    std::vector<std::uint8_t> zero_width = pngHeader(0, 10);
    EXPECT_FALSE(decoder_.probeSize(zero_width).has_value());
}

TEST_F(MediaDecoderTest, DecodeRejectsUndecodableBuffer)
{
    std::vector<std::uint8_t> garbage;
    appendText(garbage, "no pixels here");
    EXPECT_FALSE(decoder_.decode(garbage).has_value());
    EXPECT_FALSE(decoder_.decode({}).has_value());
}

TEST_F(MediaDecoderTest, ContainerProbeOnMissingFileFails)
{
    EXPECT_FALSE(decoder_.probeContainer(path("missing.mp4")).has_value());

    writeText(path("fake.mp4"), "this is only text");
    EXPECT_FALSE(decoder_.probeContainer(path("fake.mp4")).has_value());
}

TEST_F(MediaDecoderTest, ColorLayoutLabels)
{
    EXPECT_EQ(LibraryMediaDecoder::colorLayoutLabel(3, CV_8U), "Rgb8");
    EXPECT_EQ(LibraryMediaDecoder::colorLayoutLabel(4, CV_8U), "Rgba8");
    EXPECT_EQ(LibraryMediaDecoder::colorLayoutLabel(1, CV_16U), "L16");
    EXPECT_EQ(LibraryMediaDecoder::colorLayoutLabel(2, CV_32F), "La32F");
}
