#include "config.h"
#include <memory>
#include <iostream>
#include <glib.h>
#include <gst/gst.h>
#include "input/rtsp-input.hpp"
#include "http/api.hpp"
#include "hls/buffer.hpp"
#include "hls/segmenter.hpp"

int main(int argc, char *argv[])
{
    gint port = DEFAULT_HTTP_PORT;
    gdouble segmentDuration = DEFAULT_SEGMENT_DURATION;
    gdouble partDuration = DEFAULT_PART_DURATION;
    gint windowSize = DEFAULT_WINDOW_SIZE;
    gboolean verbose = FALSE;
    GOptionEntry entries[] =
    {
        { "port", 'p', 0, G_OPTION_ARG_INT, &port, "HTTP port to listen on", "PORT" },
        { "segment-duration", 's', 0, G_OPTION_ARG_DOUBLE, &segmentDuration, "Target segment duration in seconds", "SECONDS" },
        { "part-duration", 'P', 0, G_OPTION_ARG_DOUBLE, &partDuration, "Nominal part duration in seconds", "SECONDS" },
        { "window-size", 'w', 0, G_OPTION_ARG_INT, &windowSize, "Number of segments kept in the playlist", "COUNT" },
        { "verbose", 'v', 0, G_OPTION_ARG_NONE, &verbose, "Trace every request", NULL },
        { NULL, 0, 0, G_OPTION_ARG_NONE, NULL, NULL, NULL }
    };

    GError *error = NULL;
    GOptionContext *context = g_option_context_new("rtsp://...");
    g_option_context_set_summary(context, APPLICATION_NAME " " APPLICATION_VERSION " - low-latency HLS origin");
    g_option_context_add_main_entries(context, entries, NULL);
    g_option_context_add_group(context, gst_init_get_option_group());
    if (!g_option_context_parse(context, &argc, &argv, &error))
    {
        std::cerr << error->message << std::endl;
        g_error_free(error);
        g_option_context_free(context);
        return 1;
    }
    if (argc != 2)
    {
        gchar *help = g_option_context_get_help(context, TRUE, NULL);
        std::cerr << help;
        g_free(help);
        g_option_context_free(context);
        return 1;
    }
    g_option_context_free(context);

    std::shared_ptr<const HLSStreamSettings> settings =
        HLSStreamSettings::create(segmentDuration, partDuration, windowSize, &error);
    if (!settings)
    {
        std::cerr << error->message << std::endl;
        g_error_free(error);
        return 1;
    }

    std::shared_ptr<HLSBuffer> buffer = std::make_shared<HLSBuffer>(settings);
    std::shared_ptr<HLSSegmenter> segmenter = std::make_shared<HLSSegmenter>(buffer);
    std::shared_ptr<RTSPInput> rtspInput = std::make_shared<RTSPInput>(argv[1], segmenter);
    std::shared_ptr<HTTPAPI> httpAPI = std::make_shared<HTTPAPI>(port, buffer, verbose);

    std::cout << "part target " << settings->partTargetDuration << "s, advance part limit " <<
        settings->hlsAdvancePartLimit << ", window of " << settings->windowSize << " segments" << std::endl;

    GMainLoop *main_loop = g_main_loop_new(NULL, FALSE);
    g_main_loop_run(main_loop);
    g_main_loop_unref(main_loop);

    return 0;
}
