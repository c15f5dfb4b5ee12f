#include "range-request.hpp"
#include <algorithm>
#include <sstream>
#include <libsoup/soup.h>

HLSByteRange::HLSByteRange():
    start(0),
    end(HLS_BYTE_RANGE_OPEN_END)
{
}

HLSByteRange::HLSByteRange(std::uint64_t start, std::uint64_t end):
    start(start),
    end(end)
{
}

bool HLSByteRange::isOpenEnded() const
{
    return end >= HLS_BYTE_RANGE_OPEN_END;
}

bool HLSByteRange::parse(const char *header, HLSByteRange *range)
{
    if (!header || !g_str_has_prefix(header, "bytes="))
    {
        return false;
    }
    const char *cursor = header + 6;
    if (!g_ascii_isdigit(*cursor))
    {
        return false;
    }
    gchar *end = NULL;
    guint64 start = g_ascii_strtoull(cursor, &end, 10);
    if (*end != '-')
    {
        return false;
    }
    cursor = end + 1;
    guint64 last = HLS_BYTE_RANGE_OPEN_END;
    if (*cursor)
    {
        if (!g_ascii_isdigit(*cursor))
        {
            return false;
        }
        last = g_ascii_strtoull(cursor, &end, 10);
        if (*end || last < start)
        {
            return false;
        }
    }
    range->start = start;
    range->end = last;
    return true;
}

struct HLSRangeRequest::Private
{
    std::shared_ptr<HLSBuffer> buffer;
    int sequence;
    bool ranged;
    HLSByteRange range;
    Callback callback;
    std::weak_ptr<HLSWaiter> waiter;
    bool graceUsed;
    bool processed;
};

HLSRangeRequest::HLSRangeRequest(std::shared_ptr<HLSBuffer> buffer, int sequence, Callback callback):
    priv(std::make_shared<Private>())
{
    priv->buffer = buffer;
    priv->sequence = sequence;
    priv->ranged = false;
    priv->callback = callback;
    priv->graceUsed = false;
    priv->processed = false;
}

HLSRangeRequest::HLSRangeRequest(std::shared_ptr<HLSBuffer> buffer, int sequence, const HLSByteRange &range,
    Callback callback):
    HLSRangeRequest(buffer, sequence, callback)
{
    priv->ranged = true;
    priv->range = range;
}

void HLSRangeRequest::dispatch()
{
    std::shared_ptr<HLSBuffer> buffer = priv->buffer;
    if (buffer->isStopped())
    {
        respond(HLSResponse(SOUP_STATUS_NOT_FOUND));
        return;
    }

    std::shared_ptr<const HLSSegment> segment = buffer->getSegment(priv->sequence);
    if (!segment)
    {
        if (priv->sequence <= buffer->lastSequence() || priv->graceUsed)
        {
            respond(HLSResponse(SOUP_STATUS_NOT_FOUND));
        }
        else
        {
            // A hinted segment may be requested just before the producer creates it.
            priv->graceUsed = true;
            wait(HLSCondition::segmentAppears(priv->sequence));
        }
        return;
    }

    const std::uint64_t start = priv->ranged ? priv->range.start : 0;
    const std::uint64_t dataSize = segment->getDataSize();
    if (start >= dataSize)
    {
        if (!segment->isComplete())
        {
            wait(HLSCondition::bytesAvailable(priv->sequence, start));
            return;
        }
        if (priv->ranged)
        {
            HLSResponse response(SOUP_STATUS_REQUESTED_RANGE_NOT_SATISFIABLE);
            std::stringstream ss;
            ss << "bytes */" << dataSize;
            response.contentRange = ss.str();
            respond(response);
            return;
        }
    }

    if (!priv->ranged)
    {
        HLSResponse response(SOUP_STATUS_OK);
        response.contentType = HLS_SEGMENT_CONTENT_TYPE;
        response.data = segment->getData();
        respond(response);
        return;
    }

    const std::uint64_t last = std::min<std::uint64_t>(priv->range.end, dataSize - 1);
    HLSResponse response(SOUP_STATUS_PARTIAL_CONTENT);
    response.contentType = HLS_SEGMENT_CONTENT_TYPE;
    response.data = segment->getData(start, last);
    std::stringstream ss;
    ss << "bytes " << start << "-" << last << "/";
    if (segment->isComplete())
    {
        ss << dataSize;
    }
    else
    {
        ss << "*";
    }
    response.contentRange = ss.str();
    respond(response);
}

void HLSRangeRequest::cancel()
{
    if (std::shared_ptr<HLSWaiter> waiter = priv->waiter.lock())
    {
        priv->buffer->waiters().remove(waiter);
    }
    priv->waiter.reset();
    priv->processed = true;
}

bool HLSRangeRequest::isProcessed() const
{
    return priv->processed;
}

bool HLSRangeRequest::isBlocked() const
{
    return !priv->processed && !priv->waiter.expired();
}

void HLSRangeRequest::wait(const HLSCondition &condition)
{
    std::shared_ptr<HLSRangeRequest> self = shared_from_this();
    priv->waiter = priv->buffer->waiters().add(condition, [self](HLSWaitResult result)
    {
        self->priv->waiter.reset();
        if (result == HLSWaitResult::Ready)
        {
            self->dispatch();
        }
        else
        {
            self->respond(HLSResponse(SOUP_STATUS_NOT_FOUND));
        }
    });
}

void HLSRangeRequest::respond(const HLSResponse &response)
{
    if (priv->processed)
    {
        return;
    }
    priv->processed = true;
    priv->callback(response);
}
