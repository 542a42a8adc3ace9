#include "core/detection_profile.hpp"
#include <algorithm>
#include <cctype>

std::string toLowerAscii(const std::string &text)
{
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool containsIgnoreCase(const std::string &haystack, const std::string &needle)
{
    if (needle.empty())
        return true;
    return toLowerAscii(haystack).find(toLowerAscii(needle)) != std::string::npos;
}

static bool containsDims(const std::vector<Dimensions> &list, const Dimensions &dims)
{
    return std::find(list.begin(), list.end(), dims) != list.end();
}

DetectionProfile DetectionProfile::defaults()
{
    DetectionProfile profile;

    profile.indicator_vocabulary = {"tiktok", "douyin", "bytedance", "musically",
                                    "musical.ly", "aigc_label_type", "vid_md5"};
    profile.camera_markers = {"Focal Length", "Aperture", "ISO"};

    profile.brand_terms = {"tiktok", "douyin", "bytedance", "musically"};
    // The 'g' before the quality letter is absent in some exported files
    profile.video_id_pattern = std::regex(R"(vid:v\d+g?[fl]0000[a-f0-9]+)");

    profile.app_resolutions = {
        {576, 1024}, {576, 1246}, {576, 1280},
        {1080, 1920}, {1080, 1800}, {1080, 2340}, {1080, 2400},
        {828, 1792}, {750, 1334}, {1125, 2436}, {1242, 2688},
        {1284, 2778}, {1170, 2532}};

    profile.screenshot_resolutions = {
        {1080, 1920}, {1080, 1800}, {1080, 2340}, {1080, 2400},
        {828, 1792}, {750, 1334}, {1125, 2436}, {1242, 2688},
        {1284, 2778}, {1170, 2532}};

    profile.video_resolutions = {
        {576, 1024}, {576, 1246}, {576, 1280}, {720, 1280}, {1080, 1920}};
    profile.preferred_video_resolutions = {{576, 1024}, {1080, 1920}};

    profile.encoder_tokens = {
        {"ByteDance", 25},
        {"Lavf58.76.100", 20},
        {"Lavf", 10},
        {"mp4v", 8},
        {"isom", 8}, // contains the camera marker "ISO" ignoring case, so the exclusion rule fires first
        {"Douyin", 25},
        {"Musical.ly", 8},
        {"aigc_info", 40},
        {"vid_md5", 35}};

    return profile;
}

bool DetectionProfile::isAppResolution(const Dimensions &dims) const
{
    return containsDims(app_resolutions, dims);
}

bool DetectionProfile::isScreenshotResolution(const Dimensions &dims) const
{
    return containsDims(screenshot_resolutions, dims);
}

bool DetectionProfile::isVideoResolution(const Dimensions &dims) const
{
    return containsDims(video_resolutions, dims);
}

bool DetectionProfile::isPreferredVideoResolution(const Dimensions &dims) const
{
    return containsDims(preferred_video_resolutions, dims);
}

bool DetectionProfile::containsIndicator(const std::string &text) const
{
    const std::string lowered = toLowerAscii(text);
    for (const auto &term : indicator_vocabulary)
    {
        if (lowered.find(term) != std::string::npos)
            return true;
    }
    return false;
}

bool DetectionProfile::containsCameraMarker(const std::string &text) const
{
    for (const auto &marker : camera_markers)
    {
        if (text.find(marker) != std::string::npos)
            return true;
    }
    return false;
}
