#pragma once
#include <list>
#include <memory>
#include <string>
#include "segment.hpp"
#include "stream-settings.hpp"

#define HLS_DEFAULT_URI_PREFIX "/api/"

class HLSBuffer;

class HLSPlaylist
{
public:
    static std::string render(const std::list<std::shared_ptr<const HLSSegment>> &segments,
        const HLSStreamSettings &settings, int discontinuitySequence,
        const std::string &uriPrefix = HLS_DEFAULT_URI_PREFIX);
    static std::string render(const HLSBuffer &buffer, const std::string &uriPrefix = HLS_DEFAULT_URI_PREFIX);
};
