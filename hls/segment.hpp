#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <glib.h>
#include "partial-segment.hpp"

class HLSBuffer;

class HLSSegment
{
public:
    typedef std::map<std::size_t, std::shared_ptr<const HLSPartialSegment>> PartMap;

    HLSSegment(int sequence, GDateTime *dateTime = NULL, std::vector<std::uint8_t> init = std::vector<std::uint8_t>());
    ~HLSSegment();

    int getSequence() const;
    std::string getProgramDateTime() const;
    const std::vector<std::uint8_t> &getInit() const;
    bool isDiscontinuity() const;
    bool isComplete() const;
    double getDuration() const;
    std::size_t getDataSize() const;
    int getPartCount() const;

    // Copy of the offset -> part map, safe to iterate while the producer appends.
    PartMap getParts() const;
    std::shared_ptr<const HLSPartialSegment> getPartialSegment(int index) const;
    std::vector<std::uint8_t> getData(std::uint64_t start, std::uint64_t last) const;
    std::vector<std::uint8_t> getData() const;

    struct Private;
private:
    friend class HLSBuffer;
    bool appendPart(std::shared_ptr<const HLSPartialSegment> part, GError **error);
    bool seal(double duration, GError **error);
    void markDiscontinuity();

    std::shared_ptr<Private> priv;
};
