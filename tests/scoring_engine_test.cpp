#include <gtest/gtest.h>
#include "core/detection_profile.hpp"
#include "core/scoring_engine.hpp"

class ScoringEngineTest : public ::testing::Test
{
protected:
    ScoringEngineTest() : profile_(DetectionProfile::defaults()), engine_(profile_) {}

    static EvidenceBundle bundle(const std::string &filename, uint64_t size = 1000)
    {
        EvidenceBundle e;
        e.file_path = "/samples/" + filename;
        e.filename = filename;
        e.file_size = size;
        return e;
    }

    DetectionProfile profile_;
    ScoringEngine engine_;
};

TEST_F(ScoringEngineTest, AigcWebpDisguisedAsPngIsConfirmed)
{
    EvidenceBundle e = bundle("photo.png");
    e.setDimensions(1080, 1920);
    e.format = "WebP";
    e.found_strings = {"{\"aigc_label_type\":0}"};

    ScoreResult result = engine_.score(e, MediaKind::GENERIC);

    EXPECT_EQ(result.confidence, 100);
    EXPECT_EQ(result.verdict, Verdict::CONFIRMED);
    EXPECT_TRUE(result.is_match);
    std::vector<std::string> expected = {
        "AIGC metadata found",
        "TikTok-typical dimensions: 1080x1920",
        "9:16 aspect ratio",
        "Portrait orientation",
        "WebP format with PNG extension"};
    EXPECT_EQ(result.evidence, expected);
    EXPECT_EQ(result.indicators.at("video_dimensions"), "1080x1920");
    EXPECT_EQ(result.indicators.at("format_mismatch"), "webp_as_png");
}

TEST_F(ScoringEngineTest, CameraMetadataExcludesEverything)
{
    EvidenceBundle e = bundle("IMG_0001.jpg");
    e.setDimensions(1080, 1920);
    e.found_strings = {"tiktok watermark", "Focal Length 4.2mm"};

    ScoreResult result = engine_.score(e, MediaKind::PHOTO);

    EXPECT_EQ(result.confidence, 0);
    EXPECT_EQ(result.verdict, Verdict::UNLIKELY);
    EXPECT_FALSE(result.is_match);
    ASSERT_EQ(result.evidence.size(), 1u);
    EXPECT_EQ(result.indicators.size(), 1u);
    EXPECT_EQ(result.indicators.at("camera_photo"), "excluded");
}

TEST_F(ScoringEngineTest, CameraMarkersMatchIgnoringCase)
{
    EvidenceBundle e = bundle("clip.mp4");
    e.found_strings = {"bytedance aperture f/1.8"};

    ScoreResult result = engine_.score(e, MediaKind::VIDEO);

    EXPECT_EQ(result.confidence, 0);
    EXPECT_EQ(result.indicators.count("camera_photo"), 1u);
}

TEST_F(ScoringEngineTest, IsomBrandTriggersCameraExclusion)
{
    EvidenceBundle e = bundle("clip.mp4");
    e.found_strings = {"bytedance isom"};

    ScoreResult result = engine_.score(e, MediaKind::VIDEO);

    EXPECT_EQ(result.confidence, 0);
    EXPECT_EQ(result.indicators.at("camera_photo"), "excluded");
}

TEST_F(ScoringEngineTest, HashFilenameScoresPerPath)
{
    EvidenceBundle e = bundle("d41d8cd98f00b204e9800998ecf8427e.png");

    ScoreResult generic = engine_.score(e, MediaKind::GENERIC);
    EXPECT_EQ(generic.confidence, 10);
    EXPECT_EQ(generic.verdict, Verdict::UNLIKELY);
    EXPECT_EQ(generic.indicators.at("filename_pattern"), "md5_hash");

    ScoreResult photo = engine_.score(e, MediaKind::PHOTO);
    EXPECT_EQ(photo.confidence, 18);
    EXPECT_EQ(photo.verdict, Verdict::UNLIKELY);
}

TEST_F(ScoringEngineTest, HashFilenameRequiresHexStemAndSingleDot)
{
    EXPECT_TRUE(ScoringEngine::isHashFilename("D41D8CD98F00B204E9800998ECF8427E.jpg"));
    EXPECT_FALSE(ScoringEngine::isHashFilename("z41d8cd98f00b204e9800998ecf8427e.png"));
    EXPECT_FALSE(ScoringEngine::isHashFilename("d41d8cd98f00b204e9800998ecf842.7e.png"));
    EXPECT_FALSE(ScoringEngine::isHashFilename("d41d8cd98f00b204e9800998ecf8427e.jpeg"));
    EXPECT_FALSE(ScoringEngine::isHashFilename("photo.png"));
}

TEST_F(ScoringEngineTest, VideoIdMatchesWithAndWithoutQualityPrefix)
{
    EvidenceBundle with_g = bundle("a.mp4");
    with_g.found_strings = {"tiktok vid:v12044gf0000cabc123"};
    ScoreResult r1 = engine_.score(with_g, MediaKind::GENERIC);
    EXPECT_EQ(r1.indicators.at("tiktok_video_id"), "vid:v12044gf0000cabc123");

    EvidenceBundle without_g = bundle("b.mp4");
    without_g.found_strings = {"tiktok vid:v0900l0000deadbeef"};
    ScoreResult r2 = engine_.score(without_g, MediaKind::GENERIC);
    EXPECT_EQ(r2.indicators.at("tiktok_video_id"), "vid:v0900l0000deadbeef");

    // video id 35 + brand strings 20
    EXPECT_EQ(r1.confidence, 55);
    EXPECT_EQ(r1.verdict, Verdict::LIKELY);
}

TEST_F(ScoringEngineTest, ContentHashAndBrandStrings)
{
    EvidenceBundle e = bundle("x.jpg");
    e.found_strings = {"vid_md5=abcdef", "Douyin"};

    ScoreResult result = engine_.score(e, MediaKind::GENERIC);

    // vid_md5 30 + brand 20
    EXPECT_EQ(result.confidence, 50);
    EXPECT_EQ(result.indicators.at("vid_md5"), "found");
    EXPECT_EQ(result.indicators.at("string_indicators"), "Douyin");
}

TEST_F(ScoringEngineTest, VerdictThresholds)
{
    EXPECT_EQ(Verdicts::fromScore(0), Verdict::UNLIKELY);
    EXPECT_EQ(Verdicts::fromScore(19), Verdict::UNLIKELY);
    EXPECT_EQ(Verdicts::fromScore(20), Verdict::POSSIBLE);
    EXPECT_EQ(Verdicts::fromScore(39), Verdict::POSSIBLE);
    EXPECT_EQ(Verdicts::fromScore(40), Verdict::LIKELY);
    EXPECT_EQ(Verdicts::fromScore(69), Verdict::LIKELY);
    EXPECT_EQ(Verdicts::fromScore(70), Verdict::CONFIRMED);

    EXPECT_FALSE(Verdicts::isMatch(Verdict::POSSIBLE));
    EXPECT_TRUE(Verdicts::isMatch(Verdict::LIKELY));
    EXPECT_TRUE(Verdicts::isMatch(Verdict::CONFIRMED));
}

TEST_F(ScoringEngineTest, DownloadedPortraitVideo)
{
    EvidenceBundle e = bundle("Download_7261.MP4");
    e.setDimensions(1080, 1920);

    ScoreResult result = engine_.score(e, MediaKind::VIDEO);

    // base 25+15+5, video 30+15+10+20, download name 25
    EXPECT_EQ(result.confidence, 145);
    EXPECT_EQ(result.verdict, Verdict::CONFIRMED);
    EXPECT_EQ(result.indicators.at("video_resolution"), "1080x1920");
}

TEST_F(ScoringEngineTest, LooselyPortraitVideoGetsSmallerRatioBonus)
{
    EvidenceBundle e = bundle("clip.mov");
    e.setDimensions(720, 1080);

    ScoreResult result = engine_.score(e, MediaKind::VIDEO);

    // portrait 5, vertical 10, ratio < 0.8 gives 8
    EXPECT_EQ(result.confidence, 23);
    EXPECT_EQ(result.verdict, Verdict::POSSIBLE);
    EXPECT_FALSE(result.is_match);
}

TEST_F(ScoringEngineTest, EncoderTokensCountFirstMatchPerString)
{
    EvidenceBundle e = bundle("clip.mp4");
    e.found_strings = {"bytedance Lavf58.76.100", "tiktok mp4v"};

    ScoreResult result = engine_.score(e, MediaKind::VIDEO);

    // brand 20, then ByteDance 25 for the first string and mp4v 8 for the second
    EXPECT_EQ(result.confidence, 53);
    EXPECT_EQ(result.evidence.front(), "TikTok strings found in file");
}

TEST_F(ScoringEngineTest, PhotoFileSizeBand)
{
    EvidenceBundle inside = bundle("a.jpg", 600000);
    EvidenceBundle edge = bundle("b.jpg", 500000);

    EXPECT_EQ(engine_.score(inside, MediaKind::PHOTO).confidence, 5);
    EXPECT_EQ(engine_.score(edge, MediaKind::PHOTO).confidence, 0);
}

TEST_F(ScoringEngineTest, BaseEvidencePrecedesKindEvidence)
{
    EvidenceBundle e = bundle("shot.png");
    e.setDimensions(1080, 1920);

    ScoreResult result = engine_.score(e, MediaKind::PHOTO);

    ASSERT_GE(result.evidence.size(), 5u);
    EXPECT_EQ(result.evidence[0], "TikTok-typical dimensions: 1080x1920");
    EXPECT_EQ(result.evidence[3], "Mobile screenshot dimensions: 1080x1920");
    EXPECT_EQ(result.evidence[4], "Phone screen aspect ratio");
    EXPECT_EQ(result.confidence, 70);
}

TEST_F(ScoringEngineTest, ScoringIsDeterministic)
{
    EvidenceBundle e = bundle("video.mp4", 2000000);
    e.setDimensions(576, 1024);
    e.found_strings = {"TikTok", "aigc_label_type"};

    ScoreResult first = engine_.score(e, MediaKind::VIDEO);
    ScoreResult second = engine_.score(e, MediaKind::VIDEO);

    EXPECT_EQ(first.confidence, second.confidence);
    EXPECT_EQ(first.evidence, second.evidence);
    EXPECT_EQ(first.indicators, second.indicators);
}

TEST_F(ScoringEngineTest, MissingEvidenceScoresZero)
{
    ScoreResult result = engine_.score(bundle("notes.gif"), MediaKind::PHOTO);
    EXPECT_EQ(result.confidence, 0);
    EXPECT_TRUE(result.evidence.empty());
    EXPECT_EQ(result.verdict, Verdict::UNLIKELY);
}
