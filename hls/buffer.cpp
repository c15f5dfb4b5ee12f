#include "buffer.hpp"
#include <iterator>
#include "error.hpp"

struct HLSBuffer::Private
{
    std::shared_ptr<const HLSStreamSettings> settings;
    std::list<std::shared_ptr<HLSSegment>> segments;
    int discontinuitySequence;
    bool stopped;
    HLSWaiterRegistry waiters;

    std::shared_ptr<HLSSegment> findSegment(int sequence) const;
    bool checkRunning(GError **error) const;
};

std::shared_ptr<HLSSegment> HLSBuffer::Private::findSegment(int sequence) const
{
    if (segments.empty() || sequence < segments.front()->getSequence() || sequence > segments.back()->getSequence())
    {
        return std::shared_ptr<HLSSegment>();
    }
    // Sequence numbers in the window are contiguous.
    auto it = segments.begin();
    std::advance(it, sequence - segments.front()->getSequence());
    return *it;
}

bool HLSBuffer::Private::checkRunning(GError **error) const
{
    if (stopped)
    {
        g_set_error_literal(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_STOPPED, "stream has stopped");
        return false;
    }
    return true;
}

HLSBuffer::HLSBuffer(std::shared_ptr<const HLSStreamSettings> settings):
    priv(std::make_shared<Private>())
{
    priv->settings = settings;
    priv->discontinuitySequence = 0;
    priv->stopped = false;
}

HLSBuffer::~HLSBuffer()
{

}

bool HLSBuffer::put(std::shared_ptr<HLSSegment> segment, GError **error)
{
    if (!priv->checkRunning(error))
    {
        return false;
    }
    if (priv->segments.size())
    {
        std::shared_ptr<HLSSegment> recentSegment = priv->segments.back();
        if (!recentSegment->isComplete())
        {
            g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_UNSEALED_SEGMENT,
                "segment %d must be sealed before segment %d is put",
                recentSegment->getSequence(), segment->getSequence());
            return false;
        }
        if (segment->getSequence() != recentSegment->getSequence() + 1)
        {
            g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_SEQUENCE,
                "segment %d does not follow segment %d",
                segment->getSequence(), recentSegment->getSequence());
            return false;
        }
    }
    else if (segment->getSequence() < 0)
    {
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_SEQUENCE,
            "negative sequence number %d", segment->getSequence());
        return false;
    }

    priv->segments.push_back(segment);
    while (priv->segments.size() > static_cast<std::size_t>(priv->settings->windowSize))
    {
        if (priv->segments.front()->isDiscontinuity())
        {
            priv->discontinuitySequence++;
        }
        priv->segments.pop_front();
    }
    priv->waiters.broadcast(*this, HLSEvent::SegmentPut);
    return true;
}

bool HLSBuffer::appendPart(int sequence, std::shared_ptr<const HLSPartialSegment> part, bool discontinuity,
    GError **error)
{
    if (!priv->checkRunning(error))
    {
        return false;
    }
    std::shared_ptr<HLSSegment> segment = priv->findSegment(sequence);
    if (!segment)
    {
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_NOT_FOUND,
            "segment %d is not in the window", sequence);
        return false;
    }
    if (!segment->appendPart(part, error))
    {
        return false;
    }
    if (discontinuity)
    {
        segment->markDiscontinuity();
    }
    priv->waiters.broadcast(*this, HLSEvent::PartAppended);
    return true;
}

bool HLSBuffer::seal(int sequence, double duration, GError **error)
{
    if (!priv->checkRunning(error))
    {
        return false;
    }
    std::shared_ptr<HLSSegment> segment = priv->findSegment(sequence);
    if (!segment)
    {
        g_set_error(error, HLS_BUFFER_ERROR, HLS_BUFFER_ERROR_NOT_FOUND,
            "segment %d is not in the window", sequence);
        return false;
    }
    if (!segment->seal(duration, error))
    {
        return false;
    }
    priv->waiters.broadcast(*this, HLSEvent::SegmentSealed);
    return true;
}

void HLSBuffer::stop()
{
    if (priv->stopped)
    {
        return;
    }
    priv->stopped = true;
    priv->waiters.broadcast(*this, HLSEvent::Stopped);
}

std::shared_ptr<const HLSSegment> HLSBuffer::getSegment(int sequence) const
{
    return priv->findSegment(sequence);
}

std::shared_ptr<const HLSSegment> HLSBuffer::current() const
{
    if (priv->segments.empty())
    {
        return std::shared_ptr<const HLSSegment>();
    }
    return priv->segments.back();
}

std::list<std::shared_ptr<const HLSSegment>> HLSBuffer::getSegments() const
{
    return std::list<std::shared_ptr<const HLSSegment>>(priv->segments.begin(), priv->segments.end());
}

int HLSBuffer::firstSequence() const
{
    return priv->segments.empty() ? -1 : priv->segments.front()->getSequence();
}

int HLSBuffer::lastSequence() const
{
    return priv->segments.empty() ? -1 : priv->segments.back()->getSequence();
}

int HLSBuffer::getDiscontinuitySequence() const
{
    return priv->discontinuitySequence;
}

bool HLSBuffer::isStopped() const
{
    return priv->stopped;
}

std::shared_ptr<const HLSStreamSettings> HLSBuffer::getSettings() const
{
    return priv->settings;
}

HLSWaiterRegistry &HLSBuffer::waiters()
{
    return priv->waiters;
}
