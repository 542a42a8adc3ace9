#pragma once

#include <regex>
#include <string>
#include <vector>
#include "core/evidence.hpp"

struct WeightedToken
{
    std::string token;
    int weight;
};

/**
 * @brief Immutable heuristic configuration shared by the extractor and the scoring engine
 *
 * Built once at startup and handed out by const reference. Nothing in it is
 * mutated after construction, so worker threads read it without locking.
 */
class DetectionProfile
{
public:
    /**
     * @brief Profile with the built-in TikTok heuristics
     */
    static DetectionProfile defaults();

    // Extraction
    std::vector<std::string> indicator_vocabulary; // matched case-insensitively
    std::vector<std::string> camera_markers;       // retained case-sensitively, scored case-insensitively
    size_t string_scan_limit = 1024 * 1024;
    size_t min_string_length = 4;

    // Base rules
    std::vector<std::string> brand_terms;
    std::regex video_id_pattern;
    std::vector<Dimensions> app_resolutions;
    double portrait_ratio_min = 0.55;
    double portrait_ratio_max = 0.58;

    // Photo rules
    std::vector<Dimensions> screenshot_resolutions;
    double photo_target_ratio = 0.5625;
    double photo_ratio_tolerance = 0.01;
    std::uint64_t photo_size_min = 500000;
    std::uint64_t photo_size_max = 5000000;

    // Video rules
    std::vector<Dimensions> video_resolutions;
    std::vector<Dimensions> preferred_video_resolutions;
    double video_loose_ratio_max = 0.8;
    std::vector<WeightedToken> encoder_tokens; // first match per string wins
    std::string download_prefix = "download";
    std::string download_suffix = ".mp4";
    std::uint64_t video_size_min = 100000;
    std::uint64_t video_size_max = 50000000;

    bool isAppResolution(const Dimensions &dims) const;
    bool isScreenshotResolution(const Dimensions &dims) const;
    bool isVideoResolution(const Dimensions &dims) const;
    bool isPreferredVideoResolution(const Dimensions &dims) const;

    /**
     * @brief Case-insensitive check against indicator vocabulary
     */
    bool containsIndicator(const std::string &text) const;

    /**
     * @brief Case-sensitive check against camera markers, used while extracting
     */
    bool containsCameraMarker(const std::string &text) const;

private:
    DetectionProfile() = default;
};

/**
 * @brief Lowercase an ASCII string
 */
std::string toLowerAscii(const std::string &text);

/**
 * @brief Case-insensitive substring test for ASCII text
 */
bool containsIgnoreCase(const std::string &haystack, const std::string &needle);
