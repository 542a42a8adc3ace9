#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/decoder/media_decoder.hpp"
#include "core/detection_profile.hpp"
#include "core/evidence.hpp"

struct ExtractorOptions
{
    size_t max_decode_bytes = 64 * 1024 * 1024;
    bool compute_content_hash = false;
    std::set<std::string> container_extensions = {"mp4", "mov", "avi", "mkv", "flv", "webm"};
};

/**
 * @brief Turns a file on disk into an EvidenceBundle
 *
 * Stateless apart from its const collaborators, so one instance is shared by
 * every analysis worker.
 */
class EvidenceExtractor
{
public:
    EvidenceExtractor(const DetectionProfile &profile, const MediaDecoder &decoder,
                      ExtractorOptions options = ExtractorOptions());

    /**
     * @brief Gather raw evidence about a file
     * @param file_path Path to the file
     * @return Bundle with every field that could be determined
     * @throws IoError if the file cannot be opened or stat'ed
     */
    EvidenceBundle extract(const std::string &file_path) const;

    /**
     * @brief Identify a container from its leading bytes
     * @return "WebP", "PNG" or "JPEG", or nullopt for anything else
     */
    static std::optional<std::string> sniffFormat(const std::vector<std::uint8_t> &bytes);

    /**
     * @brief Collect printable runs that mention an indicator or a camera marker
     */
    std::set<std::string> scanStrings(const std::vector<std::uint8_t> &bytes) const;

private:
    struct ProbeOutcome
    {
        std::optional<Dimensions> dimensions;
        std::optional<std::string> format;
    };
    using Probe = std::function<std::optional<ProbeOutcome>()>;

    std::vector<Probe> buildProbes(const std::string &file_path, const std::vector<std::uint8_t> &head) const;

    const DetectionProfile &profile_;
    const MediaDecoder &decoder_;
    ExtractorOptions options_;
};
