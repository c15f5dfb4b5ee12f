#include "config.h"
#include "api.hpp"
#include <iostream>
#include "message.hpp"
#include "pending-message.hpp"
#include "../hls/playlist-request.hpp"
#include "../hls/range-request.hpp"

struct HTTPAPI::Private
{
    SoupServer *http_server;
    std::shared_ptr<HLSBuffer> buffer;
    bool verbose;
    PendingMessageList pendingMessages;

    void block(std::shared_ptr<PendingMessage> pending);
    void respond(std::shared_ptr<PendingMessage> pending, const HLSResponse &response);
};

void HTTPAPI::Private::block(std::shared_ptr<PendingMessage> pending)
{
    if (pending->processed)
    {
        return;
    }
    soup_server_pause_message(http_server, pending->msg);
    pending->paused = true;
    pendingMessages.add(pending);
    if (verbose)
    {
        std::cerr << pendingMessages.size() << " requests blocked" << std::endl;
    }
}

void HTTPAPI::Private::respond(std::shared_ptr<PendingMessage> pending, const HLSResponse &response)
{
    http_message_apply_response(pending->msg, response);
    if (pending->paused)
    {
        soup_server_unpause_message(http_server, pending->msg);
    }
    pending->finish();
    pendingMessages.removeProcessed();
}

HTTPAPI::HTTPAPI(const int port, std::shared_ptr<HLSBuffer> buffer, bool verbose):
    priv(std::make_shared<Private>())
{
    priv->buffer = buffer;
    priv->verbose = verbose;

    priv->http_server = soup_server_new(SOUP_SERVER_SERVER_HEADER, APPLICATION_NAME, NULL);
    g_signal_connect(priv->http_server, "request-aborted", G_CALLBACK(+[](SoupServer *, SoupMessage *msg, SoupClientContext *, gpointer user_data)
    {
        HTTPAPI::Private *priv = reinterpret_cast<HTTPAPI::Private *>(user_data);
        if (priv->pendingMessages.abort(msg) && priv->verbose)
        {
            std::cerr << "Client went away, dropping blocked request" << std::endl;
        }
    }), priv.get());
    soup_server_add_handler(priv->http_server, NULL, [](SoupServer *, SoupMessage *msg, const char *, GHashTable *, SoupClientContext *, gpointer)
    {
        http_message_set_error(msg, SOUP_STATUS_NOT_FOUND);
    }, NULL, NULL);
    soup_server_add_handler(priv->http_server, "/api/segments/", [](SoupServer *, SoupMessage *msg, const char *path, GHashTable *, SoupClientContext *, gpointer user_data)
    {
        HTTPAPI::Private *priv = reinterpret_cast<HTTPAPI::Private *>(user_data);
        const char *rangeHeader = soup_message_headers_get_one(msg->request_headers, "Range");
        int segmentNumber = 0;
        bool ranged = false;
        HLSByteRange range;
        guint status = http_parse_segment_request(path, rangeHeader, &segmentNumber, &ranged, &range);
        if (priv->verbose)
        {
            std::cerr << path << ", " << (rangeHeader ? rangeHeader : "no range") << std::endl;
        }
        if (status != SOUP_STATUS_OK)
        {
            http_message_set_error(msg, status);
            return;
        }

        std::shared_ptr<PendingMessage> pending = std::make_shared<PendingMessage>(msg);
        auto callback = [priv, pending](const HLSResponse &response)
        {
            if (priv->verbose)
            {
                std::cerr << "Segment response " << response.status << " " << response.contentRange << std::endl;
            }
            priv->respond(pending, response);
        };
        std::shared_ptr<HLSRangeRequest> request = ranged ?
            std::make_shared<HLSRangeRequest>(priv->buffer, segmentNumber, range, callback) :
            std::make_shared<HLSRangeRequest>(priv->buffer, segmentNumber, callback);
        pending->cancel = [request]() { request->cancel(); };
        request->dispatch();
        if (!request->isProcessed())
        {
            if (priv->verbose)
            {
                std::cerr << "Blocking " << path << " until its data is produced" << std::endl;
            }
            priv->block(pending);
        }
    }, priv.get(), NULL);
    soup_server_add_handler(priv->http_server, "/api/init/", [](SoupServer *, SoupMessage *msg, const char *path, GHashTable *, SoupClientContext *, gpointer user_data)
    {
        HTTPAPI::Private *priv = reinterpret_cast<HTTPAPI::Private *>(user_data);
        int segmentNumber = 0;
        if (!g_str_has_prefix(path, "/api/init/") || !http_parse_sequence(path + 10, ".mp4", &segmentNumber))
        {
            http_message_set_error(msg, SOUP_STATUS_NOT_FOUND);
            return;
        }
        std::shared_ptr<const HLSSegment> segment = priv->buffer->getSegment(segmentNumber);
        if (!segment || segment->getInit().empty() || priv->buffer->isStopped())
        {
            http_message_set_error(msg, SOUP_STATUS_NOT_FOUND);
            return;
        }
        http_message_set_no_cache(msg);
        soup_message_headers_replace(msg->response_headers, "Content-Type", "video/mp4");
        soup_message_body_append(msg->response_body, SOUP_MEMORY_COPY,
            segment->getInit().data(), segment->getInit().size());
        soup_message_set_status(msg, SOUP_STATUS_OK);
        soup_message_body_complete(msg->response_body);
    }, priv.get(), NULL);
    soup_server_add_handler(priv->http_server, "/api/lhls.m3u8", [](SoupServer *, SoupMessage *msg, const char *, GHashTable *query, SoupClientContext *, gpointer user_data)
    {
        HTTPAPI::Private *priv = reinterpret_cast<HTTPAPI::Private *>(user_data);

        int requestedMediaSequenceNumber = -1;
        int requestedPartIndex = -1;
        guint status = http_parse_playlist_query(query, &requestedMediaSequenceNumber, &requestedPartIndex);
        if (priv->verbose && (requestedMediaSequenceNumber >= 0 || requestedPartIndex >= 0))
        {
            std::cerr << "_HLS_msn=" << requestedMediaSequenceNumber << " _HLS_part=" << requestedPartIndex << std::endl;
        }
        if (status != SOUP_STATUS_OK)
        {
            http_message_set_error(msg, status);
            return;
        }

        std::shared_ptr<PendingMessage> pending = std::make_shared<PendingMessage>(msg);
        auto request = std::make_shared<HLSPlaylistRequest>(priv->buffer, requestedMediaSequenceNumber, requestedPartIndex,
            [priv, pending, requestedMediaSequenceNumber, requestedPartIndex](const HLSResponse &response)
        {
            if (priv->verbose && pending->paused)
            {
                std::cerr << "We have " << requestedMediaSequenceNumber << "." << requestedPartIndex <<
                    ", unpausing blocked playlist request" << std::endl;
            }
            priv->respond(pending, response);
        });
        pending->cancel = [request]() { request->cancel(); };
        request->dispatch();
        if (!request->isProcessed())
        {
            if (priv->verbose)
            {
                std::cerr << "Blocking playlist response..." << std::endl;
            }
            priv->block(pending);
        }
    }, priv.get(), NULL);
    if (soup_server_listen_all(priv->http_server, port, static_cast<SoupServerListenOptions>(0), 0))
    {
        std::cout << "server listening on port " << port << std::endl;
    }
    else
    {
        std::cerr << "port " << port << " could not be bound" << std::endl;
    }
}

HTTPAPI::~HTTPAPI()
{
    priv->pendingMessages.cancelAll();
    soup_server_disconnect(priv->http_server);
    g_object_unref(priv->http_server);
}
