#include "segmenter.hpp"
#include <cstdint>
#include <iostream>
#include <vector>

struct HLSSegmenter::Private
{
    std::shared_ptr<HLSBuffer> buffer;
    int nextSequence;
    int sequence;
    GstClockTime segmentPTS;
    GstClockTime partPTS;
    GstClockTime recentPTS;
    GstClockTime sampleInterval;
    bool partIndependent;
    bool discontinuity;
    std::vector<std::uint8_t> partData;

    void openSegment(GstClockTime pts);
    void closeSegment(GstClockTime pts);
    void flushPart(GstClockTime pts);
    void report(GError *error);
};

void HLSSegmenter::Private::report(GError *error)
{
    std::cerr << "Segmenter: " << error->message << std::endl;
    g_error_free(error);
}

void HLSSegmenter::Private::openSegment(GstClockTime pts)
{
    GError *error = NULL;
    GDateTime *now = g_date_time_new_now_utc();
    std::shared_ptr<HLSSegment> segment = std::make_shared<HLSSegment>(nextSequence, now);
    g_date_time_unref(now);
    if (!buffer->put(segment, &error))
    {
        report(error);
        return;
    }
    sequence = nextSequence++;
    segmentPTS = pts;
}

void HLSSegmenter::Private::flushPart(GstClockTime pts)
{
    if (partData.empty())
    {
        return;
    }
    std::shared_ptr<const HLSPartialSegment> part = std::make_shared<const HLSPartialSegment>(
        static_cast<double>(pts - partPTS) / GST_SECOND, partIndependent, std::move(partData));
    partData.clear();
    GError *error = NULL;
    if (!buffer->appendPart(sequence, part, discontinuity, &error))
    {
        report(error);
    }
    discontinuity = false;
}

void HLSSegmenter::Private::closeSegment(GstClockTime pts)
{
    if (sequence < 0)
    {
        return;
    }
    flushPart(pts);
    GError *error = NULL;
    if (!buffer->seal(sequence, static_cast<double>(pts - segmentPTS) / GST_SECOND, &error))
    {
        report(error);
    }
    sequence = -1;
}

HLSSegmenter::HLSSegmenter(std::shared_ptr<HLSBuffer> buffer):
    priv(std::make_shared<Private>())
{
    priv->buffer = buffer;
    priv->nextSequence = 0;
    priv->sequence = -1;
    priv->segmentPTS = GST_CLOCK_TIME_NONE;
    priv->partPTS = GST_CLOCK_TIME_NONE;
    priv->recentPTS = GST_CLOCK_TIME_NONE;
    priv->sampleInterval = 0;
    priv->partIndependent = false;
    priv->discontinuity = false;
}

HLSSegmenter::~HLSSegmenter()
{

}

void HLSSegmenter::onSample(GstSample *sample)
{
    GstBuffer *buffer = gst_sample_get_buffer(sample);
    if (!buffer || priv->buffer->isStopped())
    {
        gst_sample_unref(sample);
        return;
    }

    std::shared_ptr<const HLSStreamSettings> settings = priv->buffer->getSettings();
    GstClockTime pts = priv->recentPTS;
    bool sampleContainsIDR = !GST_BUFFER_FLAG_IS_SET(buffer, GST_BUFFER_FLAG_DELTA_UNIT);
    if (GST_BUFFER_PTS_IS_VALID(buffer))
    {
        pts = GST_BUFFER_PTS(buffer);
    }
    if (!GST_CLOCK_TIME_IS_VALID(pts) || (priv->sequence < 0 && !sampleContainsIDR))
    {
        // Nothing to anchor a segment on yet.
        gst_sample_unref(sample);
        return;
    }

    if (GST_CLOCK_TIME_IS_VALID(priv->recentPTS))
    {
        if (pts < priv->recentPTS)
        {
            // Timestamps went backwards: the source was re-initialized.
            std::cerr << "Timestamp discontinuity at segment " << priv->sequence << std::endl;
            priv->closeSegment(priv->recentPTS + priv->sampleInterval);
            priv->discontinuity = true;
            if (!sampleContainsIDR)
            {
                priv->recentPTS = GST_CLOCK_TIME_NONE;
                gst_sample_unref(sample);
                return;
            }
        }
        else if (pts > priv->recentPTS)
        {
            priv->sampleInterval = pts - priv->recentPTS;
        }
    }
    priv->recentPTS = pts;

    if (priv->sequence >= 0)
    {
        bool targetDurationSoon = (pts - priv->segmentPTS) >=
            (settings->segmentDuration - settings->partTargetDuration) * GST_SECOND;
        if (targetDurationSoon && sampleContainsIDR)
        {
            priv->closeSegment(pts);
        }
    }

    if (priv->sequence < 0)
    {
        priv->openSegment(pts);
        if (priv->sequence < 0)
        {
            gst_sample_unref(sample);
            return;
        }
    }
    else if (priv->partData.size() &&
        (pts + priv->sampleInterval - priv->partPTS) > settings->partTargetDuration * GST_SECOND)
    {
        // One more sample would overrun PART-TARGET.
        priv->flushPart(pts);
    }

    if (priv->partData.empty())
    {
        priv->partPTS = pts;
        priv->partIndependent = sampleContainsIDR;
    }
    GstMapInfo mapInfo;
    if (gst_buffer_map(buffer, &mapInfo, (GstMapFlags)(GST_MAP_READ)))
    {
        priv->partData.insert(priv->partData.end(), mapInfo.data, mapInfo.data + mapInfo.size);
        gst_buffer_unmap(buffer, &mapInfo);
    }
    else
    {
        std::cerr << "Could not map sample of segment " << priv->sequence << std::endl;
    }
    gst_sample_unref(sample);
}

void HLSSegmenter::onEndOfStream()
{
    if (GST_CLOCK_TIME_IS_VALID(priv->recentPTS))
    {
        priv->closeSegment(priv->recentPTS + priv->sampleInterval);
    }
    priv->buffer->stop();
}
