#pragma once

#include <atomic>
#include <optional>
#include "core/decoder/media_decoder.hpp"

// Scriptable decoder: each capability returns its preset result and counts calls
class FakeMediaDecoder : public MediaDecoder
{
public:
    std::optional<Dimensions> probe_result;
    std::optional<DecodedMedia> container_result;
    std::optional<DecodedMedia> decode_result;

    mutable std::atomic<int> probe_calls{0};
    mutable std::atomic<int> container_calls{0};
    mutable std::atomic<int> decode_calls{0};

    std::optional<Dimensions> probeSize(const std::vector<std::uint8_t> &) const override
    {
        probe_calls++;
        return probe_result;
    }

    std::optional<DecodedMedia> probeContainer(const std::string &) const override
    {
        container_calls++;
        return container_result;
    }

    std::optional<DecodedMedia> decode(const std::vector<std::uint8_t> &) const override
    {
        decode_calls++;
        return decode_result;
    }
};
