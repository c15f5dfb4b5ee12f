#include "playlist-request.hpp"
#include <libsoup/soup.h>

struct HLSPlaylistRequest::Private
{
    std::shared_ptr<HLSBuffer> buffer;
    int mediaSequenceNumber;
    int partIndex;
    std::string uriPrefix;
    Callback callback;
    std::weak_ptr<HLSWaiter> waiter;
    bool processed;
};

HLSPlaylistRequest::HLSPlaylistRequest(std::shared_ptr<HLSBuffer> buffer, int mediaSequenceNumber, int partIndex,
    Callback callback, const std::string &uriPrefix):
    priv(std::make_shared<Private>())
{
    priv->buffer = buffer;
    priv->mediaSequenceNumber = mediaSequenceNumber;
    priv->partIndex = partIndex;
    priv->uriPrefix = uriPrefix;
    priv->callback = callback;
    priv->processed = false;
}

void HLSPlaylistRequest::dispatch()
{
    std::shared_ptr<HLSBuffer> buffer = priv->buffer;
    if (buffer->isStopped())
    {
        reject(SOUP_STATUS_NOT_FOUND);
        return;
    }

    int msn = priv->mediaSequenceNumber;
    int part = priv->partIndex;
    if (msn < 0)
    {
        if (part >= 0)
        {
            // _HLS_part requires _HLS_msn.
            reject(SOUP_STATUS_BAD_REQUEST);
        }
        else if (buffer->current())
        {
            serve();
        }
        else
        {
            wait(HLSCondition::segmentExists(-1));
        }
        return;
    }

    const int lastSequence = buffer->lastSequence();
    if (msn > lastSequence + 1)
    {
        reject(SOUP_STATUS_BAD_REQUEST);
        return;
    }

    if (part < 0)
    {
        if (msn <= lastSequence)
        {
            if (buffer->getSegment(msn))
            {
                serve();
            }
            else
            {
                reject(SOUP_STATUS_NOT_FOUND);
            }
        }
        else
        {
            wait(HLSCondition::segmentExists(msn));
        }
        return;
    }

    const int advancePartLimit = buffer->getSettings()->hlsAdvancePartLimit;
    std::shared_ptr<const HLSSegment> lastSegment = buffer->current();
    if (lastSegment && msn == lastSequence && part >= lastSegment->getPartCount() - 1 + advancePartLimit)
    {
        reject(SOUP_STATUS_BAD_REQUEST);
        return;
    }

    HLSCondition::normalizePart(*buffer, &msn, &part);
    if (msn < lastSequence)
    {
        if (buffer->getSegment(msn))
        {
            serve();
        }
        else
        {
            reject(SOUP_STATUS_NOT_FOUND);
        }
    }
    else if (msn == lastSequence)
    {
        if (part < lastSegment->getPartCount())
        {
            serve();
        }
        else
        {
            wait(HLSCondition::partAvailable(msn, part));
        }
    }
    else if (part + 1 >= advancePartLimit)
    {
        // Part of the segment after the live one, too many parts ahead of the live edge.
        reject(SOUP_STATUS_BAD_REQUEST);
    }
    else
    {
        wait(HLSCondition::partAvailable(msn, part));
    }
}

void HLSPlaylistRequest::cancel()
{
    if (std::shared_ptr<HLSWaiter> waiter = priv->waiter.lock())
    {
        priv->buffer->waiters().remove(waiter);
    }
    priv->waiter.reset();
    priv->processed = true;
}

bool HLSPlaylistRequest::isProcessed() const
{
    return priv->processed;
}

bool HLSPlaylistRequest::isBlocked() const
{
    return !priv->processed && !priv->waiter.expired();
}

void HLSPlaylistRequest::wait(const HLSCondition &condition)
{
    std::shared_ptr<HLSPlaylistRequest> self = shared_from_this();
    priv->waiter = priv->buffer->waiters().add(condition, [self](HLSWaitResult result)
    {
        self->priv->waiter.reset();
        if (result == HLSWaitResult::Ready)
        {
            self->serve();
        }
        else
        {
            self->reject(SOUP_STATUS_NOT_FOUND);
        }
    });
}

void HLSPlaylistRequest::serve()
{
    if (priv->processed)
    {
        return;
    }
    priv->processed = true;
    HLSResponse response(SOUP_STATUS_OK);
    response.contentType = HLS_PLAYLIST_CONTENT_TYPE;
    response.playlist = HLSPlaylist::render(*priv->buffer, priv->uriPrefix);
    priv->callback(response);
}

void HLSPlaylistRequest::reject(guint status)
{
    if (priv->processed)
    {
        return;
    }
    priv->processed = true;
    priv->callback(HLSResponse(status));
}
