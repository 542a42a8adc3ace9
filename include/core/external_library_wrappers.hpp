#pragma once

#include <memory>

extern "C"
{
#include <libavformat/avformat.h>
}

// Closes a demuxer context opened by avformat_open_input
struct AVFormatInputCloser
{
    void operator()(AVFormatContext *ctx) const
    {
        if (ctx)
            avformat_close_input(&ctx);
    }
};

using AVFormatInputPtr = std::unique_ptr<AVFormatContext, AVFormatInputCloser>;
