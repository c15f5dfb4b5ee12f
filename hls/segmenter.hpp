#pragma once
#include <memory>
#include <gst/gst.h>
#include "buffer.hpp"
#include "../input/rtsp-input.hpp"

// Cuts the MPEG-TS sample stream into parts and segments and feeds them to the buffer.
class HLSSegmenter: public RTSPInput::Delegate
{
public:
    explicit HLSSegmenter(std::shared_ptr<HLSBuffer> buffer);
    virtual ~HLSSegmenter();
    virtual void onSample(GstSample *sample) override final;
    virtual void onEndOfStream() override final;
    struct Private;
private:
    std::shared_ptr<Private> priv;
};
