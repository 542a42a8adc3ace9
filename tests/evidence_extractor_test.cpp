#include "test_base.hpp"
#include "fake_media_decoder.hpp"
#include "core/evidence_extractor.hpp"
#include "core/scan_errors.hpp"

class EvidenceExtractorTest : public TestBase
{
protected:
    EvidenceExtractorTest() : profile_(DetectionProfile::defaults()) {}

    static std::vector<std::uint8_t> bytesOf(const std::string &text)
    {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }

    DetectionProfile profile_;
    FakeMediaDecoder decoder_;
};

TEST_F(EvidenceExtractorTest, MissingFileThrowsIoError)
{
    EvidenceExtractor extractor(profile_, decoder_);
    EXPECT_THROW(extractor.extract(path("absent.png")), IoError);

    try
    {
        extractor.extract(path("absent.png"));
    }
    catch (const IoError &e)
    {
        EXPECT_EQ(e.path(), path("absent.png"));
    }
}

TEST_F(EvidenceExtractorTest, ScanStringsKeepsIndicatorRuns)
{
    EvidenceExtractor extractor(profile_, decoder_);
    std::vector<std::uint8_t> bytes;
    appendText(bytes, "made with TikTok");
    bytes.push_back(0x01);
    appendText(bytes, "tik");       // too short
    bytes.push_back(0x00);
    appendText(bytes, "ordinary text");
    bytes.push_back(0xFF);
    appendText(bytes, "x-vid_md5");

    std::set<std::string> found = extractor.scanStrings(bytes);

    std::set<std::string> expected = {"made with TikTok", "x-vid_md5"};
    EXPECT_EQ(found, expected);
}

TEST_F(EvidenceExtractorTest, CameraMarkersRetainedOnlyWithExactCase)
{
    EvidenceExtractor extractor(profile_, decoder_);
    std::vector<std::uint8_t> bytes;
    appendText(bytes, "Focal Length 26mm");
    bytes.push_back(0x00);
    appendText(bytes, "focal length 26mm");
    bytes.push_back(0x00);
    appendText(bytes, "ISO 100");

    std::set<std::string> found = extractor.scanStrings(bytes);

    EXPECT_EQ(found.count("Focal Length 26mm"), 1u);
    EXPECT_EQ(found.count("focal length 26mm"), 0u);
    EXPECT_EQ(found.count("ISO 100"), 1u);
}

TEST_F(EvidenceExtractorTest, ScanStringsStopsAtScanLimit)
{
    EvidenceExtractor extractor(profile_, decoder_);
    std::vector<std::uint8_t> bytes(profile_.string_scan_limit, 0x00);
    appendText(bytes, "tiktok beyond the limit");

    EXPECT_TRUE(extractor.scanStrings(bytes).empty());
}

TEST_F(EvidenceExtractorTest, RunStraddlingLimitIsTruncated)
{
    EvidenceExtractor extractor(profile_, decoder_);
    std::vector<std::uint8_t> bytes(profile_.string_scan_limit - 6, 0x00);
    appendText(bytes, "tiktok-tail");

    std::set<std::string> found = extractor.scanStrings(bytes);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(*found.begin(), "tiktok");
}

TEST_F(EvidenceExtractorTest, SniffFormatRecognizesSignatures)
{
    EXPECT_EQ(EvidenceExtractor::sniffFormat(webpHeader(10, 10)), std::optional<std::string>("WebP"));
    EXPECT_EQ(EvidenceExtractor::sniffFormat(pngHeader(10, 10)), std::optional<std::string>("PNG"));
    EXPECT_EQ(EvidenceExtractor::sniffFormat({0xFF, 0xD8, 0xFF, 0xE0}), std::optional<std::string>("JPEG"));
    EXPECT_FALSE(EvidenceExtractor::sniffFormat(bytesOf("GIF89a")).has_value());
    EXPECT_FALSE(EvidenceExtractor::sniffFormat({}).has_value());
}

TEST_F(EvidenceExtractorTest, HeaderProbeWinsAndSniffSetsFormat)
{
    decoder_.probe_result = Dimensions{1080, 1920};
    EvidenceExtractor extractor(profile_, decoder_);
    writeFile(path("photo.png"), tiktokPhotoBytes());

    EvidenceBundle bundle = extractor.extract(path("photo.png"));

    EXPECT_EQ(bundle.filename, "photo.png");
    EXPECT_EQ(bundle.file_size, tiktokPhotoBytes().size());
    ASSERT_TRUE(bundle.dimensions.has_value());
    EXPECT_EQ(*bundle.dimensions, (Dimensions{1080, 1920}));
    ASSERT_TRUE(bundle.aspect_ratio.has_value());
    EXPECT_NEAR(*bundle.aspect_ratio, 0.5625, 1e-9);
    EXPECT_EQ(bundle.format, std::optional<std::string>("WebP"));
    EXPECT_EQ(bundle.found_strings.count("{\"aigc_label_type\":0}"), 1u);
    EXPECT_FALSE(bundle.content_hash.has_value());

    EXPECT_EQ(decoder_.probe_calls.load(), 1);
    EXPECT_EQ(decoder_.container_calls.load(), 0);
    EXPECT_EQ(decoder_.decode_calls.load(), 0);
}

TEST_F(EvidenceExtractorTest, ContainerProbeOnlyForVideoExtensions)
{
    decoder_.container_result = DecodedMedia{Dimensions{576, 1024}, "MOV"};
    EvidenceExtractor extractor(profile_, decoder_);
    writeText(path("clip.mp4"), "not really a movie");
    writeText(path("still.jpg"), "not really a photo");

    EvidenceBundle video = extractor.extract(path("clip.mp4"));
    EXPECT_EQ(*video.dimensions, (Dimensions{576, 1024}));
    EXPECT_EQ(video.format, std::optional<std::string>("MOV"));
    EXPECT_EQ(decoder_.container_calls.load(), 1);
    EXPECT_EQ(decoder_.decode_calls.load(), 0);

    EvidenceBundle photo = extractor.extract(path("still.jpg"));
    EXPECT_EQ(decoder_.container_calls.load(), 1);
    EXPECT_EQ(decoder_.decode_calls.load(), 1);
    EXPECT_FALSE(photo.dimensions.has_value());
    EXPECT_EQ(photo.format, std::optional<std::string>("JPG"));
}

TEST_F(EvidenceExtractorTest, FullDecodeUsedWhenProbesFail)
{
    decoder_.decode_result = DecodedMedia{Dimensions{720, 1280}, "Rgb8"};
    EvidenceExtractor extractor(profile_, decoder_);
    writeText(path("frame.bmp"), "opaque pixel data");

    EvidenceBundle bundle = extractor.extract(path("frame.bmp"));

    EXPECT_EQ(*bundle.dimensions, (Dimensions{720, 1280}));
    EXPECT_EQ(bundle.format, std::optional<std::string>("Rgb8"));
    EXPECT_EQ(decoder_.probe_calls.load(), 1);
    EXPECT_EQ(decoder_.decode_calls.load(), 1);
}

TEST_F(EvidenceExtractorTest, FullDecodeSkippedAboveSizeLimit)
{
    decoder_.decode_result = DecodedMedia{Dimensions{720, 1280}, "Rgb8"};
    ExtractorOptions options;
    options.max_decode_bytes = 4;
    EvidenceExtractor extractor(profile_, decoder_, options);
    writeText(path("big.gif"), "more than four bytes");

    EvidenceBundle bundle = extractor.extract(path("big.gif"));

    EXPECT_EQ(decoder_.decode_calls.load(), 0);
    EXPECT_FALSE(bundle.dimensions.has_value());
    EXPECT_FALSE(bundle.aspect_ratio.has_value());
    EXPECT_EQ(bundle.format, std::optional<std::string>("GIF"));
}

TEST_F(EvidenceExtractorTest, SignatureOverridesProbeLabel)
{
    decoder_.decode_result = DecodedMedia{Dimensions{100, 200}, "Rgba8"};
    EvidenceExtractor extractor(profile_, decoder_);
    std::vector<std::uint8_t> bytes = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10};
    writeFile(path("renamed.png"), bytes);

    EvidenceBundle bundle = extractor.extract(path("renamed.png"));

    EXPECT_EQ(bundle.format, std::optional<std::string>("JPEG"));
    EXPECT_EQ(*bundle.dimensions, (Dimensions{100, 200}));
}

TEST_F(EvidenceExtractorTest, ExtensionlessFileHasNoFormat)
{
    EvidenceExtractor extractor(profile_, decoder_);
    writeText(path("README"), "plain words");

    EvidenceBundle bundle = extractor.extract(path("README"));

    EXPECT_FALSE(bundle.format.has_value());
    EXPECT_FALSE(bundle.dimensions.has_value());
}

TEST_F(EvidenceExtractorTest, ContentHashWhenEnabled)
{
    ExtractorOptions options;
    options.compute_content_hash = true;
    EvidenceExtractor extractor(profile_, decoder_, options);
    writeText(path("abc.jpg"), "abc");

    EvidenceBundle bundle = extractor.extract(path("abc.jpg"));

    ASSERT_TRUE(bundle.content_hash.has_value());
    EXPECT_EQ(*bundle.content_hash, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(EvidenceExtractorTest, RealDecoderReadsWebpCanvas)
{
    LibraryMediaDecoder decoder;
    EvidenceExtractor extractor(profile_, decoder);
    writeFile(path("tiktok.png"), tiktokPhotoBytes());

    EvidenceBundle bundle = extractor.extract(path("tiktok.png"));

    ASSERT_TRUE(bundle.dimensions.has_value());
    EXPECT_EQ(*bundle.dimensions, (Dimensions{1080, 1920}));
    EXPECT_EQ(bundle.format, std::optional<std::string>("WebP"));
}
