#include "config.h"
#include "rtsp-input.hpp"
#include <iostream>
#include <gst/app/gstappsink.h>

struct RTSPInput::Private
{
    std::weak_ptr<Delegate> delegate;
    GstElement *pipeline;
    guint busWatch;
};

struct SampleDelivery
{
    std::weak_ptr<RTSPInput::Delegate> delegate;
    GstSample *sample;
};

RTSPInput::Delegate::~Delegate()
{

}

static gboolean deliver_sample(gpointer user_data)
{
    SampleDelivery *delivery = reinterpret_cast<SampleDelivery *>(user_data);
    if (auto delegate = delivery->delegate.lock())
    {
        GstSample *sample = delivery->sample;
        delivery->sample = NULL;
        delegate->onSample(sample);
    }
    return G_SOURCE_REMOVE;
}

static void free_delivery(gpointer user_data)
{
    SampleDelivery *delivery = reinterpret_cast<SampleDelivery *>(user_data);
    if (delivery->sample)
    {
        gst_sample_unref(delivery->sample);
    }
    delete delivery;
}

static gboolean on_message(GstBus *, GstMessage *message, gpointer user_data)
{
    RTSPInput::Private *priv = reinterpret_cast<RTSPInput::Private *>(user_data);
    switch (GST_MESSAGE_TYPE(message)) {
    case GST_MESSAGE_ERROR:
        {
            GError *error = NULL;
            gchar *debug = NULL;
            gst_message_parse_error(message, &error, &debug);
            std::cerr << "Pipeline error: " << (error ? error->message : "unknown") << std::endl;
            if (debug)
            {
                std::cerr << debug << std::endl;
            }
            g_clear_error(&error);
            g_free(debug);
        }
        /* fall through */
    case GST_MESSAGE_EOS:
        if (auto delegate = priv->delegate.lock())
        {
            delegate->onEndOfStream();
        }
        break;
    default:
        break;
    }
    return TRUE;
}

static GstFlowReturn tssink_new_sample(GstAppSink *appsink, gpointer user_data)
{
    RTSPInput::Private *priv = reinterpret_cast<RTSPInput::Private *>(user_data);
    if (GstSample *sample = gst_app_sink_pull_sample(appsink))
    {
        // Streaming thread: hand the sample over to the main loop that owns the buffer.
        SampleDelivery *delivery = new SampleDelivery;
        delivery->delegate = priv->delegate;
        delivery->sample = sample;
        g_main_context_invoke_full(NULL, G_PRIORITY_DEFAULT, deliver_sample, delivery, free_delivery);
    }
    return GST_FLOW_OK;
}

static void rtspsrc_pad_added(GstElement *, GstPad *new_pad, GstElement *rtph264depay)
{
    GstPad *sinkPad = gst_element_get_static_pad(rtph264depay, "sink");

    GstPadLinkReturn ret;
    GstCaps *new_pad_caps = NULL;
    GstStructure *new_pad_struct = NULL;
    const gchar *new_pad_type = NULL;
    const gchar *new_pad_media = NULL;

    if (gst_pad_is_linked(sinkPad))
    {
        goto exit;
    }

    new_pad_caps = gst_pad_get_current_caps(new_pad);
    if (new_pad_caps == NULL)
    {
        goto exit;
    }
    new_pad_struct = gst_caps_get_structure(new_pad_caps, 0);
    new_pad_type = gst_structure_get_name(new_pad_struct);
    new_pad_media = gst_structure_get_string(new_pad_struct, "media");
    if (!g_str_has_prefix(new_pad_type, "application/x-rtp")
        || !new_pad_media || !g_str_equal(new_pad_media, "video"))
    {
        std::cerr << "Skipping pad of type \"" << new_pad_type <<
            "\" with media \"" << (new_pad_media ? new_pad_media : "none") << "\", expecting RTP video." << std::endl;
        goto exit;
    }

    ret = gst_pad_link(new_pad, sinkPad);
    if (GST_PAD_LINK_FAILED(ret))
    {
        std::cerr << "Type is \"" << new_pad_type << "\" but link failed." << std::endl;
    }

exit:
    if (new_pad_caps != NULL)
    {
        gst_caps_unref(new_pad_caps);
    }
    gst_object_unref(sinkPad);
}

RTSPInput::RTSPInput(const char *url, std::shared_ptr<Delegate> delegate):
    priv(std::make_shared<Private>())
{
    gst_init(NULL, NULL);
    priv->pipeline = gst_pipeline_new(NULL);
    priv->delegate = delegate;

    GstElement *rtspsrc = gst_element_factory_make("rtspsrc", NULL);
    g_object_set(rtspsrc, "location", url, "user-agent", APPLICATION_NAME, NULL);
    GstElement *rtph264depay = gst_element_factory_make("rtph264depay", NULL);
    g_signal_connect(rtspsrc, "pad-added", G_CALLBACK(rtspsrc_pad_added), rtph264depay);
    GstElement *h264parse = gst_element_factory_make("h264parse", NULL);
    g_object_set(h264parse, "config-interval", -1, NULL);
    GstElement *tsmux = gst_element_factory_make("mpegtsmux", NULL);
    GstElement *tsparse = gst_element_factory_make("tsparse", NULL);
    g_object_set(tsparse, "set-timestamps", TRUE, "split-on-rai", TRUE, NULL);
    GstElement *tssink = gst_element_factory_make("appsink", NULL);
    g_object_set(tssink, "emit-signals", TRUE, "sync", FALSE, NULL);
    g_signal_connect(tssink, "new-sample", G_CALLBACK(tssink_new_sample), priv.get());

    gst_bin_add_many(GST_BIN(priv->pipeline), rtspsrc, rtph264depay, h264parse, tsmux, tsparse, tssink, NULL);
    if (!gst_element_link_many(rtph264depay, h264parse, tsmux, tsparse, tssink, NULL))
    {
        std::cerr << "Could not link the ingest pipeline" << std::endl;
    }

    GstBus *bus = gst_element_get_bus(priv->pipeline);
    priv->busWatch = gst_bus_add_watch(bus, on_message, priv.get());
    gst_object_unref(bus);

    if (gst_element_set_state(priv->pipeline, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE)
    {
        std::cerr << "Could not start reading " << url << std::endl;
    }
}

RTSPInput::~RTSPInput()
{
    gst_element_set_state(priv->pipeline, GST_STATE_NULL);
    if (priv->busWatch)
    {
        g_source_remove(priv->busWatch);
    }
    gst_object_unref(priv->pipeline);
}
