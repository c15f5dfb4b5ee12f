#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

struct HLSPartialSegment
{
    const double duration;
    const bool independent;
    const std::vector<std::uint8_t> data;

    HLSPartialSegment(double duration, bool independent, std::vector<std::uint8_t> data):
        duration(duration),
        independent(independent),
        data(std::move(data))
    {
    }

    std::size_t size() const
    {
        return data.size();
    }
};
