#pragma once
#include <list>
#include <memory>
#include <glib.h>
#include "segment.hpp"
#include "stream-settings.hpp"
#include "waiter.hpp"

class HLSBuffer
{
public:
    explicit HLSBuffer(std::shared_ptr<const HLSStreamSettings> settings);
    virtual ~HLSBuffer();

    bool put(std::shared_ptr<HLSSegment> segment, GError **error);
    bool appendPart(int sequence, std::shared_ptr<const HLSPartialSegment> part, bool discontinuity, GError **error);
    bool seal(int sequence, double duration, GError **error);
    void stop();

    std::shared_ptr<const HLSSegment> getSegment(int sequence) const;
    std::shared_ptr<const HLSSegment> current() const;
    std::list<std::shared_ptr<const HLSSegment>> getSegments() const;
    int firstSequence() const;
    int lastSequence() const;
    int getDiscontinuitySequence() const;
    bool isStopped() const;

    std::shared_ptr<const HLSStreamSettings> getSettings() const;
    HLSWaiterRegistry &waiters();
    struct Private;
private:
    std::shared_ptr<Private> priv;
};
