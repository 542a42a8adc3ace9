#include "core/scoring_engine.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

static std::vector<RuleMatch> single(const std::string &evidence,
                                     const std::string &key = "",
                                     const std::string &value = "")
{
    return {RuleMatch{evidence, key, value, std::nullopt}};
}

static bool anyStringContains(const EvidenceBundle &evidence, const std::string &needle)
{
    for (const auto &s : evidence.found_strings)
    {
        if (containsIgnoreCase(s, needle))
            return true;
    }
    return false;
}

static bool endsWithIgnoreCase(const std::string &text, const std::string &suffix)
{
    if (text.size() < suffix.size())
        return false;
    return toLowerAscii(text.substr(text.size() - suffix.size())) == toLowerAscii(suffix);
}

static bool startsWithIgnoreCase(const std::string &text, const std::string &prefix)
{
    if (text.size() < prefix.size())
        return false;
    return toLowerAscii(text.substr(0, prefix.size())) == toLowerAscii(prefix);
}

static std::string formatRatio(double ratio)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << ratio;
    return ss.str();
}

ScoringEngine::ScoringEngine(const DetectionProfile &profile)
    : profile_(profile)
{
    base_rules_ = buildBaseRules();
    photo_rules_ = buildPhotoRules();
    video_rules_ = buildVideoRules();
}

bool ScoringEngine::isHashFilename(const std::string &filename)
{
    if (filename.size() != 36)
        return false;

    size_t dot = filename.find('.');
    if (dot != 32 || filename.find('.', dot + 1) != std::string::npos)
        return false;

    for (size_t i = 0; i < dot; ++i)
    {
        if (!std::isxdigit(static_cast<unsigned char>(filename[i])))
            return false;
    }
    return true;
}

bool ScoringEngine::isCameraPhoto(const EvidenceBundle &evidence) const
{
    for (const auto &marker : profile_.camera_markers)
    {
        if (anyStringContains(evidence, marker))
            return true;
    }
    return false;
}

ScoreResult ScoringEngine::score(const EvidenceBundle &evidence, MediaKind kind) const
{
    ScoreResult result;

    if (isCameraPhoto(evidence))
    {
        result.evidence.push_back("Camera photo metadata detected (focal length, ISO, or aperture)");
        result.indicators["camera_photo"] = "excluded";
        finalize(result);
        Logger::debug("Excluded camera photo: " + evidence.filename);
        return result;
    }

    applyRules(base_rules_, evidence, result);
    if (kind == MediaKind::PHOTO)
        applyRules(photo_rules_, evidence, result);
    else if (kind == MediaKind::VIDEO)
        applyRules(video_rules_, evidence, result);

    finalize(result);
    Logger::debug("Scored " + evidence.filename + " as " + MediaKinds::getName(kind) + ": " +
                  std::to_string(result.confidence) + " (" + Verdicts::getName(result.verdict) + ")");
    return result;
}

void ScoringEngine::applyRules(const std::vector<ScoringRule> &rules, const EvidenceBundle &evidence, ScoreResult &result)
{
    for (const auto &rule : rules)
    {
        for (const auto &match : rule.evaluate(evidence))
        {
            result.confidence += match.weight.value_or(rule.weight);
            result.evidence.push_back(match.evidence);
            if (!match.indicator_key.empty())
                result.indicators[match.indicator_key] = match.indicator_value;
        }
    }
}

void ScoringEngine::finalize(ScoreResult &result)
{
    if (result.confidence < 0)
        result.confidence = 0;
    result.verdict = Verdicts::fromScore(result.confidence);
    result.is_match = Verdicts::isMatch(result.verdict);
}

std::vector<ScoringRule> ScoringEngine::buildBaseRules() const
{
    const DetectionProfile &profile = profile_;
    std::vector<ScoringRule> rules;

    rules.push_back({"aigc_metadata", 40, [](const EvidenceBundle &e)
                     {
                         if (!anyStringContains(e, "aigc_label_type"))
                             return std::vector<RuleMatch>();
                         return single("AIGC metadata found", "aigc_metadata", "found");
                     }});

    rules.push_back({"tiktok_video_id", 35, [&profile](const EvidenceBundle &e)
                     {
                         for (const auto &s : e.found_strings)
                         {
                             std::smatch m;
                             if (std::regex_search(s, m, profile.video_id_pattern))
                                 return single("TikTok video ID found", "tiktok_video_id", m.str(0));
                         }
                         return std::vector<RuleMatch>();
                     }});

    rules.push_back({"vid_md5", 30, [](const EvidenceBundle &e)
                     {
                         if (!anyStringContains(e, "vid_md5"))
                             return std::vector<RuleMatch>();
                         return single("ByteDance content hash found", "vid_md5", "found");
                     }});

    rules.push_back({"app_dimensions", 25, [&profile](const EvidenceBundle &e)
                     {
                         if (!e.dimensions || !profile.isAppResolution(*e.dimensions))
                             return std::vector<RuleMatch>();
                         std::string dims = e.dimensions->toString();
                         return single("TikTok-typical dimensions: " + dims, "video_dimensions", dims);
                     }});

    rules.push_back({"portrait_ratio", 15, [&profile](const EvidenceBundle &e)
                     {
                         if (!e.aspect_ratio || *e.aspect_ratio < profile.portrait_ratio_min ||
                             *e.aspect_ratio > profile.portrait_ratio_max)
                             return std::vector<RuleMatch>();
                         return single("9:16 aspect ratio", "aspect_ratio", formatRatio(*e.aspect_ratio));
                     }});

    rules.push_back({"portrait_orientation", 5, [](const EvidenceBundle &e)
                     {
                         if (!e.dimensions || e.dimensions->height <= e.dimensions->width)
                             return std::vector<RuleMatch>();
                         return single("Portrait orientation");
                     }});

    rules.push_back({"webp_as_png", 15, [](const EvidenceBundle &e)
                     {
                         if (!e.format || !endsWithIgnoreCase(e.filename, ".png") ||
                             !containsIgnoreCase(*e.format, "webp"))
                             return std::vector<RuleMatch>();
                         return single("WebP format with PNG extension", "format_mismatch", "webp_as_png");
                     }});

    rules.push_back({"hash_filename", 10, [](const EvidenceBundle &e)
                     {
                         if (!isHashFilename(e.filename))
                             return std::vector<RuleMatch>();
                         return single("MD5-like hash filename", "filename_pattern", "md5_hash");
                     }});

    rules.push_back({"brand_strings", 20, [&profile](const EvidenceBundle &e)
                     {
                         std::string joined;
                         for (const auto &s : e.found_strings)
                         {
                             for (const auto &term : profile.brand_terms)
                             {
                                 if (containsIgnoreCase(s, term))
                                 {
                                     joined += (joined.empty() ? "" : ", ") + s;
                                     break;
                                 }
                             }
                         }
                         if (joined.empty())
                             return std::vector<RuleMatch>();
                         return single("TikTok strings found in file", "string_indicators", joined);
                     }});

    return rules;
}

std::vector<ScoringRule> ScoringEngine::buildPhotoRules() const
{
    const DetectionProfile &profile = profile_;
    std::vector<ScoringRule> rules;

    rules.push_back({"screenshot_dimensions", 15, [&profile](const EvidenceBundle &e)
                     {
                         if (!e.dimensions || !profile.isScreenshotResolution(*e.dimensions))
                             return std::vector<RuleMatch>();
                         return single("Mobile screenshot dimensions: " + e.dimensions->toString());
                     }});

    rules.push_back({"phone_screen_ratio", 10, [&profile](const EvidenceBundle &e)
                     {
                         if (!e.aspect_ratio ||
                             std::fabs(*e.aspect_ratio - profile.photo_target_ratio) > profile.photo_ratio_tolerance)
                             return std::vector<RuleMatch>();
                         return single("Phone screen aspect ratio");
                     }});

    rules.push_back({"hash_png_filename", 8, [](const EvidenceBundle &e)
                     {
                         if (!isHashFilename(e.filename) || !endsWithIgnoreCase(e.filename, ".png"))
                             return std::vector<RuleMatch>();
                         return single("Hash-style PNG filename");
                     }});

    rules.push_back({"photo_size", 5, [&profile](const EvidenceBundle &e)
                     {
                         if (e.file_size <= profile.photo_size_min || e.file_size >= profile.photo_size_max)
                             return std::vector<RuleMatch>();
                         return single("Typical TikTok photo file size");
                     }});

    return rules;
}

std::vector<ScoringRule> ScoringEngine::buildVideoRules() const
{
    const DetectionProfile &profile = profile_;
    std::vector<ScoringRule> rules;

    rules.push_back({"video_resolution", 30, [&profile](const EvidenceBundle &e)
                     {
                         if (!e.dimensions || !profile.isVideoResolution(*e.dimensions))
                             return std::vector<RuleMatch>();
                         std::string dims = e.dimensions->toString();
                         return single("TikTok video resolution: " + dims, "video_resolution", dims);
                     }});

    rules.push_back({"preferred_resolution", 15, [&profile](const EvidenceBundle &e)
                     {
                         if (!e.dimensions || !profile.isPreferredVideoResolution(*e.dimensions))
                             return std::vector<RuleMatch>();
                         return single("Common TikTok export resolution");
                     }});

    rules.push_back({"vertical_video", 10, [](const EvidenceBundle &e)
                     {
                         if (!e.dimensions || e.dimensions->width >= e.dimensions->height)
                             return std::vector<RuleMatch>();
                         return single("Vertical video");
                     }});

    rules.push_back({"video_ratio", 20, [&profile](const EvidenceBundle &e)
                     {
                         if (!e.aspect_ratio || *e.aspect_ratio < profile.portrait_ratio_min ||
                             *e.aspect_ratio > profile.portrait_ratio_max)
                             return std::vector<RuleMatch>();
                         return single("9:16 video aspect ratio");
                     }});

    // Only when the strict band above did not fire
    rules.push_back({"portrait_leaning_ratio", 8, [&profile](const EvidenceBundle &e)
                     {
                         if (!e.aspect_ratio)
                             return std::vector<RuleMatch>();
                         double ratio = *e.aspect_ratio;
                         bool in_band = ratio >= profile.portrait_ratio_min && ratio <= profile.portrait_ratio_max;
                         if (in_band || ratio >= profile.video_loose_ratio_max)
                             return std::vector<RuleMatch>();
                         return single("Portrait-leaning aspect ratio");
                     }});

    rules.push_back({"encoder_signatures", 0, [&profile](const EvidenceBundle &e)
                     {
                         std::vector<RuleMatch> matches;
                         for (const auto &s : e.found_strings)
                         {
                             for (const auto &token : profile.encoder_tokens)
                             {
                                 if (containsIgnoreCase(s, token.token))
                                 {
                                     matches.push_back(RuleMatch{"Encoder signature: " + token.token,
                                                                 "encoder_signature", token.token, token.weight});
                                     break;
                                 }
                             }
                         }
                         return matches;
                     }});

    rules.push_back({"download_filename", 25, [&profile](const EvidenceBundle &e)
                     {
                         if (!startsWithIgnoreCase(e.filename, profile.download_prefix) ||
                             !endsWithIgnoreCase(e.filename, profile.download_suffix))
                             return std::vector<RuleMatch>();
                         return single("Downloaded video filename");
                     }});

    rules.push_back({"video_size", 5, [&profile](const EvidenceBundle &e)
                     {
                         if (e.file_size <= profile.video_size_min || e.file_size >= profile.video_size_max)
                             return std::vector<RuleMatch>();
                         return single("Typical TikTok video file size");
                     }});

    return rules;
}
