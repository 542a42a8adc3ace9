#include "core/decoder/media_decoder.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

static std::uint32_t readBe16(const std::vector<std::uint8_t> &b, size_t pos)
{
    return (static_cast<std::uint32_t>(b[pos]) << 8) | b[pos + 1];
}

static std::uint32_t readBe32(const std::vector<std::uint8_t> &b, size_t pos)
{
    return (static_cast<std::uint32_t>(b[pos]) << 24) | (static_cast<std::uint32_t>(b[pos + 1]) << 16) |
           (static_cast<std::uint32_t>(b[pos + 2]) << 8) | b[pos + 3];
}

static std::uint32_t readLe16(const std::vector<std::uint8_t> &b, size_t pos)
{
    return b[pos] | (static_cast<std::uint32_t>(b[pos + 1]) << 8);
}

static std::uint32_t readLe24(const std::vector<std::uint8_t> &b, size_t pos)
{
    return b[pos] | (static_cast<std::uint32_t>(b[pos + 1]) << 8) | (static_cast<std::uint32_t>(b[pos + 2]) << 16);
}

static std::uint32_t readLe32(const std::vector<std::uint8_t> &b, size_t pos)
{
    return readLe24(b, pos) | (static_cast<std::uint32_t>(b[pos + 3]) << 24);
}

static bool matchesAt(const std::vector<std::uint8_t> &b, size_t pos, const char *magic, size_t len)
{
    return b.size() >= pos + len && std::memcmp(b.data() + pos, magic, len) == 0;
}

static std::optional<Dimensions> makeDimensions(std::uint32_t width, std::uint32_t height)
{
    if (width == 0 || height == 0 || width > 0x7fffffff || height > 0x7fffffff)
        return std::nullopt;
    return Dimensions{static_cast<int>(width), static_cast<int>(height)};
}

std::optional<Dimensions> LibraryMediaDecoder::probeSize(const std::vector<std::uint8_t> &bytes) const
{
    if (auto dims = probePng(bytes))
        return dims;
    if (auto dims = probeWebp(bytes))
        return dims;
    if (auto dims = probeJpeg(bytes))
        return dims;
    if (auto dims = probeGif(bytes))
        return dims;
    return probeBmp(bytes);
}

std::optional<Dimensions> LibraryMediaDecoder::probePng(const std::vector<std::uint8_t> &bytes)
{
    static const char png_magic[] = "\x89PNG\r\n\x1a\n";
    if (bytes.size() < 24 || !matchesAt(bytes, 0, png_magic, 8) || !matchesAt(bytes, 12, "IHDR", 4))
        return std::nullopt;
    return makeDimensions(readBe32(bytes, 16), readBe32(bytes, 20));
}

std::optional<Dimensions> LibraryMediaDecoder::probeGif(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.size() < 10 || !(matchesAt(bytes, 0, "GIF87a", 6) || matchesAt(bytes, 0, "GIF89a", 6)))
        return std::nullopt;
    return makeDimensions(readLe16(bytes, 6), readLe16(bytes, 8));
}

std::optional<Dimensions> LibraryMediaDecoder::probeBmp(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.size() < 26 || !matchesAt(bytes, 0, "BM", 2))
        return std::nullopt;

    std::uint32_t header_size = readLe32(bytes, 14);
    if (header_size == 12)
        return makeDimensions(readLe16(bytes, 18), readLe16(bytes, 20));

    // Negative height marks a top-down bitmap
    std::int64_t height = static_cast<std::int32_t>(readLe32(bytes, 22));
    if (height < 0)
        height = -height;
    if (height > 0x7fffffff)
        return std::nullopt;
    return makeDimensions(readLe32(bytes, 18), static_cast<std::uint32_t>(height));
}

std::optional<Dimensions> LibraryMediaDecoder::probeJpeg(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.size() < 4 || bytes[0] != 0xFF || bytes[1] != 0xD8)
        return std::nullopt;

    size_t pos = 2;
    while (pos + 4 <= bytes.size())
    {
        if (bytes[pos] != 0xFF)
            return std::nullopt;
        std::uint8_t marker = bytes[pos + 1];
        if (marker == 0xFF)
        {
            ++pos; // fill byte
            continue;
        }
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8))
        {
            pos += 2;
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA)
            return std::nullopt; // no frame header before image data

        std::uint32_t length = readBe16(bytes, pos + 2);
        bool is_sof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (is_sof)
        {
            if (pos + 9 > bytes.size())
                return std::nullopt;
            return makeDimensions(readBe16(bytes, pos + 7), readBe16(bytes, pos + 5));
        }
        if (length < 2)
            return std::nullopt;
        pos += 2 + length;
    }
    return std::nullopt;
}

std::optional<Dimensions> LibraryMediaDecoder::probeWebp(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.size() < 30 || !matchesAt(bytes, 0, "RIFF", 4) || !matchesAt(bytes, 8, "WEBP", 4))
        return std::nullopt;

    if (matchesAt(bytes, 12, "VP8X", 4))
        return makeDimensions(readLe24(bytes, 24) + 1, readLe24(bytes, 27) + 1);

    if (matchesAt(bytes, 12, "VP8L", 4))
    {
        if (bytes[20] != 0x2F)
            return std::nullopt;
        std::uint32_t b0 = bytes[21], b1 = bytes[22], b2 = bytes[23], b3 = bytes[24];
        std::uint32_t width = 1 + (((b1 & 0x3F) << 8) | b0);
        std::uint32_t height = 1 + (((b3 & 0x0F) << 10) | (b2 << 2) | ((b1 & 0xC0) >> 6));
        return makeDimensions(width, height);
    }

    if (matchesAt(bytes, 12, "VP8 ", 4))
    {
        if (bytes[23] != 0x9D || bytes[24] != 0x01 || bytes[25] != 0x2A)
            return std::nullopt;
        return makeDimensions(readLe16(bytes, 26) & 0x3FFF, readLe16(bytes, 28) & 0x3FFF);
    }

    return std::nullopt;
}

std::optional<DecodedMedia> LibraryMediaDecoder::probeContainer(const std::string &file_path) const
{
    AVFormatContext *raw_ctx = nullptr;
    int open_result = avformat_open_input(&raw_ctx, file_path.c_str(), nullptr, nullptr);
    if (open_result < 0)
    {
        char err_buf[AV_ERROR_MAX_STRING_SIZE];
        av_strerror(open_result, err_buf, AV_ERROR_MAX_STRING_SIZE);
        Logger::debug("Container probe could not open " + file_path + ": " + std::string(err_buf));
        return std::nullopt;
    }
    AVFormatInputPtr format_ctx(raw_ctx);

    if (avformat_find_stream_info(format_ctx.get(), nullptr) < 0)
    {
        Logger::debug("Container probe found no stream info in " + file_path);
        return std::nullopt;
    }

    for (unsigned int i = 0; i < format_ctx->nb_streams; i++)
    {
        const AVCodecParameters *params = format_ctx->streams[i]->codecpar;
        if (params->codec_type != AVMEDIA_TYPE_VIDEO || params->width <= 0 || params->height <= 0)
            continue;

        // Demuxer names look like "mov,mp4,m4a,3gp,3g2,mj2"; keep the first alias
        std::string label = format_ctx->iformat ? format_ctx->iformat->name : "";
        label = label.substr(0, label.find(','));
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return DecodedMedia{Dimensions{params->width, params->height}, label};
    }
    return std::nullopt;
}

std::optional<DecodedMedia> LibraryMediaDecoder::decode(const std::vector<std::uint8_t> &bytes) const
{
    if (bytes.empty())
        return std::nullopt;

    try
    {
        cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<std::uint8_t *>(bytes.data()));
        cv::Mat image = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
        if (image.empty() || image.cols <= 0 || image.rows <= 0)
            return std::nullopt;
        return DecodedMedia{Dimensions{image.cols, image.rows}, colorLayoutLabel(image.channels(), image.depth())};
    }
    catch (const cv::Exception &e)
    {
        Logger::debug("OpenCV could not decode buffer: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::string LibraryMediaDecoder::colorLayoutLabel(int channels, int depth)
{
    std::string layout;
    switch (channels)
    {
    case 1:
        layout = "L";
        break;
    case 2:
        layout = "La";
        break;
    case 3:
        layout = "Rgb";
        break;
    case 4:
        layout = "Rgba";
        break;
    default:
        layout = "Unknown";
        break;
    }

    switch (depth)
    {
    case CV_8U:
        return layout + "8";
    case CV_16U:
        return layout + "16";
    case CV_32F:
        return layout + "32F";
    default:
        return layout;
    }
}
