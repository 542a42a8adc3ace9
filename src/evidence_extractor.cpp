#include "core/evidence_extractor.hpp"
#include "core/file_utils.hpp"
#include "core/scan_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

EvidenceExtractor::EvidenceExtractor(const DetectionProfile &profile, const MediaDecoder &decoder,
                                     ExtractorOptions options)
    : profile_(profile), decoder_(decoder), options_(std::move(options))
{
}

EvidenceBundle EvidenceExtractor::extract(const std::string &file_path) const
{
    auto metadata = FileUtils::getFileMetadata(file_path);
    if (!metadata)
    {
        throw IoError(file_path, "cannot read file attributes");
    }

    std::vector<std::uint8_t> head;
    if (!FileUtils::readFileHead(file_path, profile_.string_scan_limit, head))
    {
        throw IoError(file_path, "cannot open file");
    }

    EvidenceBundle bundle;
    bundle.file_path = file_path;
    bundle.filename = fs::path(file_path).filename().string();
    bundle.file_size = metadata->file_size;
    bundle.found_strings = scanStrings(head);

    for (const auto &probe : buildProbes(file_path, head))
    {
        auto outcome = probe();
        if (!outcome)
            continue;
        if (outcome->dimensions)
            bundle.setDimensions(outcome->dimensions->width, outcome->dimensions->height);
        bundle.format = outcome->format;
        break;
    }

    // Byte signatures are authoritative over anything a probe reported
    if (auto sniffed = sniffFormat(head))
    {
        bundle.format = sniffed;
    }

    if (options_.compute_content_hash)
    {
        std::string hash = FileUtils::computeFileHash(file_path);
        if (!hash.empty())
            bundle.content_hash = hash;
        else
            Logger::warn("Could not hash " + file_path);
    }

    Logger::trace("Extracted " + bundle.filename + ": size=" + std::to_string(bundle.file_size) +
                  ", dims=" + (bundle.dimensions ? bundle.dimensions->toString() : "none") +
                  ", format=" + bundle.format.value_or("none") +
                  ", strings=" + std::to_string(bundle.found_strings.size()));
    return bundle;
}

std::vector<EvidenceExtractor::Probe> EvidenceExtractor::buildProbes(const std::string &file_path,
                                                                     const std::vector<std::uint8_t> &head) const
{
    std::vector<Probe> probes;

    probes.push_back([this, &head]() -> std::optional<ProbeOutcome>
                     {
        auto dims = decoder_.probeSize(head);
        if (!dims)
            return std::nullopt;
        return ProbeOutcome{dims, std::nullopt}; });

    const std::string ext = FileUtils::getFileExtension(file_path);
    if (options_.container_extensions.count(ext) > 0)
    {
        probes.push_back([this, &file_path]() -> std::optional<ProbeOutcome>
                         {
            auto media = decoder_.probeContainer(file_path);
            if (!media)
                return std::nullopt;
            return ProbeOutcome{media->dimensions, media->format_label}; });
    }

    probes.push_back([this, &file_path, &head]() -> std::optional<ProbeOutcome>
                     {
        auto metadata = FileUtils::getFileMetadata(file_path);
        if (!metadata || metadata->file_size > options_.max_decode_bytes)
            return std::nullopt;

        std::vector<std::uint8_t> full;
        if (metadata->file_size <= head.size())
            full = head;
        else if (!FileUtils::readFileHead(file_path, static_cast<size_t>(metadata->file_size), full))
            return std::nullopt;

        auto media = decoder_.decode(full);
        if (!media)
            return std::nullopt;
        return ProbeOutcome{media->dimensions, media->format_label}; });

    probes.push_back([ext]() -> std::optional<ProbeOutcome>
                     {
        if (ext.empty())
            return std::nullopt;
        std::string label = ext;
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return ProbeOutcome{std::nullopt, label}; });

    return probes;
}

std::optional<std::string> EvidenceExtractor::sniffFormat(const std::vector<std::uint8_t> &bytes)
{
    static const std::uint8_t png_magic[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

    if (bytes.size() >= 12 && std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
        std::memcmp(bytes.data() + 8, "WEBP", 4) == 0)
        return std::string("WebP");
    if (bytes.size() >= 8 && std::memcmp(bytes.data(), png_magic, 8) == 0)
        return std::string("PNG");
    if (bytes.size() >= 2 && bytes[0] == 0xFF && bytes[1] == 0xD8)
        return std::string("JPEG");
    return std::nullopt;
}

std::set<std::string> EvidenceExtractor::scanStrings(const std::vector<std::uint8_t> &bytes) const
{
    std::set<std::string> found;
    std::string current;
    const size_t limit = std::min(bytes.size(), profile_.string_scan_limit);

    auto flush = [&]()
    {
        if (current.size() >= profile_.min_string_length &&
            (profile_.containsIndicator(current) || profile_.containsCameraMarker(current)))
        {
            found.insert(current);
        }
        current.clear();
    };

    for (size_t i = 0; i < limit; ++i)
    {
        std::uint8_t byte = bytes[i];
        if (byte >= 32 && byte <= 126)
            current.push_back(static_cast<char>(byte));
        else
            flush();
    }
    flush();

    return found;
}
