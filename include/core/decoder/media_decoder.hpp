#ifndef MEDIA_DECODER_HPP
#define MEDIA_DECODER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/evidence.hpp"

/**
 * @brief Outcome of a successful decode or container probe
 */
struct DecodedMedia
{
    Dimensions dimensions;
    std::string format_label; // e.g. "Rgb8" for decoded images, "MOV" for containers
};

/**
 * @brief Decode capability used by the evidence extractor
 *
 * Each operation may fail independently; failure is reported as an empty
 * optional, never as an exception.
 */
class MediaDecoder
{
public:
    virtual ~MediaDecoder() = default;

    /**
     * @brief Read pixel dimensions from image header bytes without decoding
     * @param bytes Leading bytes of the file
     * @return Dimensions, or nullopt when the header is not recognized
     */
    virtual std::optional<Dimensions> probeSize(const std::vector<std::uint8_t> &bytes) const = 0;

    /**
     * @brief Open a media container and report its first video stream
     * @param file_path Path to the file
     * @return Stream dimensions and the demuxer name, or nullopt
     */
    virtual std::optional<DecodedMedia> probeContainer(const std::string &file_path) const = 0;

    /**
     * @brief Fully decode an image held in memory
     * @param bytes Complete file contents
     * @return Dimensions and a color-layout label, or nullopt if undecodable
     */
    virtual std::optional<DecodedMedia> decode(const std::vector<std::uint8_t> &bytes) const = 0;
};

/**
 * @brief MediaDecoder backed by header parsing, FFmpeg and OpenCV
 */
class LibraryMediaDecoder : public MediaDecoder
{
public:
    std::optional<Dimensions> probeSize(const std::vector<std::uint8_t> &bytes) const override;
    std::optional<DecodedMedia> probeContainer(const std::string &file_path) const override;
    std::optional<DecodedMedia> decode(const std::vector<std::uint8_t> &bytes) const override;

    /**
     * @brief Label an OpenCV matrix layout, e.g. 3 channels of 8 bits -> "Rgb8"
     */
    static std::string colorLayoutLabel(int channels, int depth);

private:
    static std::optional<Dimensions> probePng(const std::vector<std::uint8_t> &bytes);
    static std::optional<Dimensions> probeGif(const std::vector<std::uint8_t> &bytes);
    static std::optional<Dimensions> probeBmp(const std::vector<std::uint8_t> &bytes);
    static std::optional<Dimensions> probeJpeg(const std::vector<std::uint8_t> &bytes);
    static std::optional<Dimensions> probeWebp(const std::vector<std::uint8_t> &bytes);
};

#endif // MEDIA_DECODER_HPP
