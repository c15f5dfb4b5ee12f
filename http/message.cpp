#include "config.h"
#include "message.hpp"
#include <cstring>
#include <zlib.h>

#define SEGMENTS_PATH "/api/segments/"

void http_message_set_error(SoupMessage *msg, guint code)
{
    const char *phrase = soup_status_get_phrase(code);
    soup_message_set_response(msg, "text/plain", SOUP_MEMORY_STATIC, phrase, strlen(phrase));
    soup_message_set_status(msg, code);
}

void http_message_set_no_cache(SoupMessage *msg)
{
    soup_message_headers_replace(msg->response_headers, "Cache-Control", "no-cache, no-store, must-revalidate");
    soup_message_headers_replace(msg->response_headers, "Pragma", "no-cache");
}

bool http_message_body_append_compressed_text(SoupMessageBody *message_body, const std::string &text)
{
    z_stream zs;
    zs.zalloc = Z_NULL;
    zs.zfree = Z_NULL;
    zs.opaque = Z_NULL;
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 | 16, 8, Z_DEFAULT_STRATEGY) != Z_OK)
    {
        return false;
    }
    zs.avail_in = (uInt)text.size();
    zs.next_in = (Bytef *)text.c_str();
    char chunk[PLAYLIST_CHUNK_SIZE];
    int ret;
    do
    {
        zs.avail_out = (uInt)PLAYLIST_CHUNK_SIZE;
        zs.next_out = (Bytef *)chunk;
        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR)
        {
            deflateEnd(&zs);
            return false;
        }
        int have = PLAYLIST_CHUNK_SIZE - zs.avail_out;
        soup_message_body_append(message_body, SOUP_MEMORY_COPY, chunk, have);
    }
    while (zs.avail_out == 0);
    deflateEnd(&zs);
    return true;
}

void http_message_apply_response(SoupMessage *msg, const HLSResponse &response)
{
    http_message_set_no_cache(msg);
    if (response.contentRange.size())
    {
        soup_message_headers_replace(msg->response_headers, "Content-Range", response.contentRange.c_str());
    }
    if (response.status != SOUP_STATUS_OK && response.status != SOUP_STATUS_PARTIAL_CONTENT)
    {
        http_message_set_error(msg, response.status);
        return;
    }

    soup_message_headers_replace(msg->response_headers, "Content-Type", response.contentType.c_str());
    if (response.playlist.size())
    {
        if (http_message_body_append_compressed_text(msg->response_body, response.playlist))
        {
            soup_message_headers_replace(msg->response_headers, "Content-Encoding", "gzip");
        }
        else
        {
            soup_message_body_truncate(msg->response_body);
            soup_message_body_append(msg->response_body, SOUP_MEMORY_COPY,
                response.playlist.data(), response.playlist.size());
        }
    }
    else
    {
        soup_message_body_append(msg->response_body, SOUP_MEMORY_COPY,
            response.data.data(), response.data.size());
    }
    soup_message_set_status(msg, response.status);
    soup_message_body_complete(msg->response_body);
}

bool http_parse_directive(const gchar *text, int *value)
{
    guint64 number = 0;
    if (!text || !g_ascii_string_to_unsigned(text, 10, 0, G_MAXINT, &number, NULL))
    {
        return false;
    }
    *value = static_cast<int>(number);
    return true;
}

guint http_parse_playlist_query(GHashTable *query, int *mediaSequenceNumber, int *partIndex)
{
    *mediaSequenceNumber = -1;
    *partIndex = -1;
    if (!query)
    {
        return SOUP_STATUS_OK;
    }
    const gchar *_HLS_msn = (const gchar *)g_hash_table_lookup(query, "_HLS_msn");
    const gchar *_HLS_part = (const gchar *)g_hash_table_lookup(query, "_HLS_part");
    if ((_HLS_msn && !http_parse_directive(_HLS_msn, mediaSequenceNumber)) ||
        (_HLS_part && !http_parse_directive(_HLS_part, partIndex)))
    {
        return SOUP_STATUS_BAD_REQUEST;
    }
    return SOUP_STATUS_OK;
}

bool http_parse_sequence(const char *name, const char *suffix, int *sequence)
{
    if (!name || !g_str_has_suffix(name, suffix))
    {
        return false;
    }
    gchar *digits = g_strndup(name, strlen(name) - strlen(suffix));
    bool parsed = http_parse_directive(digits, sequence);
    g_free(digits);
    return parsed;
}

guint http_parse_segment_request(const char *path, const char *rangeHeader, int *sequence,
    bool *ranged, HLSByteRange *range)
{
    if (!path || !g_str_has_prefix(path, SEGMENTS_PATH) ||
        !http_parse_sequence(path + strlen(SEGMENTS_PATH), ".ts", sequence))
    {
        return SOUP_STATUS_NOT_FOUND;
    }
    *ranged = rangeHeader != NULL;
    if (rangeHeader && !HLSByteRange::parse(rangeHeader, range))
    {
        return SOUP_STATUS_REQUESTED_RANGE_NOT_SATISFIABLE;
    }
    return SOUP_STATUS_OK;
}
