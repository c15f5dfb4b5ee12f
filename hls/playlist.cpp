#include "playlist.hpp"
#include <iomanip>
#include <sstream>
#include "buffer.hpp"

static std::string segment_uri(const std::string &uriPrefix, int sequence)
{
    std::stringstream ss;
    ss << uriPrefix << "segments/" << sequence << ".ts";
    return ss.str();
}

std::string HLSPlaylist::render(const std::list<std::shared_ptr<const HLSSegment>> &segments,
    const HLSStreamSettings &settings, int discontinuitySequence, const std::string &uriPrefix)
{
    std::stringstream ss;
    ss << std::fixed << std::setprecision(3);
    ss << "#EXTM3U" << std::endl;
    ss << "#EXT-X-VERSION:6" << std::endl;
    ss << "#EXT-X-TARGETDURATION:" << settings.targetDuration << std::endl;
    ss << "#EXT-X-SERVER-CONTROL:CAN-BLOCK-RELOAD=YES,PART-HOLD-BACK=" << settings.partHoldBack() << std::endl;
    ss << "#EXT-X-PART-INF:PART-TARGET=" << settings.partTargetDuration << std::endl;
    ss << "#EXT-X-MEDIA-SEQUENCE:" << (segments.size() ? segments.front()->getSequence() : 0) << std::endl;
    ss << "#EXT-X-DISCONTINUITY-SEQUENCE:" << discontinuitySequence << std::endl;

    bool mapReported = false;
    int hintSequence = segments.size() ? segments.back()->getSequence() + 1 : 0;
    std::size_t hintOffset = 0;
    for (const auto &segment: segments)
    {
        if (segment->isDiscontinuity())
        {
            ss << "#EXT-X-DISCONTINUITY" << std::endl;
            mapReported = false;
        }
        if (!mapReported && segment->getInit().size())
        {
            ss << "#EXT-X-MAP:URI=\"" << uriPrefix << "init/" << segment->getSequence() << ".mp4\"" << std::endl;
            mapReported = true;
        }
        std::string uri = segment_uri(uriPrefix, segment->getSequence());
        if (segment->isComplete())
        {
            ss << "#EXT-X-PROGRAM-DATE-TIME:" << segment->getProgramDateTime() << std::endl;
            ss << "#EXTINF:" << segment->getDuration() << "," << std::endl;
            ss << uri << std::endl;
        }
        else
        {
            for (const auto &entry: segment->getParts())
            {
                ss << "#EXT-X-PART:DURATION=" << entry.second->duration;
                ss << ",URI=\"" << uri << "\"";
                ss << ",BYTERANGE=\"" << entry.second->size() << "@" << entry.first << "\"";
                if (entry.second->independent)
                {
                    ss << ",INDEPENDENT=YES";
                }
                ss << std::endl;
            }
            hintSequence = segment->getSequence();
            hintOffset = segment->getDataSize();
        }
    }
    ss << "#EXT-X-PRELOAD-HINT:TYPE=PART,URI=\"" << segment_uri(uriPrefix, hintSequence) << "\"";
    ss << ",BYTERANGE-START=" << hintOffset << std::endl;
    return ss.str();
}

std::string HLSPlaylist::render(const HLSBuffer &buffer, const std::string &uriPrefix)
{
    return render(buffer.getSegments(), *buffer.getSettings(), buffer.getDiscontinuitySequence(), uriPrefix);
}
