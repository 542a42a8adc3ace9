#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "core/verdict.hpp"

struct Dimensions
{
    int width;
    int height;

    bool operator==(const Dimensions &other) const
    {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Dimensions &other) const { return !(*this == other); }

    std::string toString() const
    {
        return std::to_string(width) + "x" + std::to_string(height);
    }
};

/**
 * @brief Raw observations about one file, produced by EvidenceExtractor
 *
 * Holds facts only. Every field that could not be determined is absent.
 */
struct EvidenceBundle
{
    std::string file_path;
    std::string filename;
    std::uint64_t file_size = 0;
    std::optional<Dimensions> dimensions;
    std::optional<double> aspect_ratio; // width / height
    std::optional<std::string> format;  // e.g. "PNG", "WebP", "JPEG"
    std::set<std::string> found_strings;
    std::optional<std::string> content_hash; // SHA-256, only when enabled

    /**
     * @brief Set dimensions and keep the aspect ratio consistent with them
     */
    void setDimensions(int width, int height)
    {
        dimensions = Dimensions{width, height};
        if (height > 0)
            aspect_ratio = static_cast<double>(width) / static_cast<double>(height);
        else
            aspect_ratio.reset();
    }
};

struct ScoreResult
{
    int confidence = 0;
    std::vector<std::string> evidence; // rule evaluation order
    std::map<std::string, std::string> indicators;
    Verdict verdict = Verdict::UNLIKELY;
    bool is_match = false;
};
