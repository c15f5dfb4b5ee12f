#pragma once
#include <memory>
#include <gst/gst.h>

class RTSPInput
{
public:
    class Delegate
    {
    public:
        // Called on the main loop; takes ownership of the sample.
        virtual void onSample(GstSample *sample) = 0;
        virtual void onEndOfStream() = 0;
        virtual ~Delegate();
    };
    RTSPInput(const char *url, std::shared_ptr<Delegate> delegate);
    ~RTSPInput();
    struct Private;
private:
    std::shared_ptr<Private> priv;
};
