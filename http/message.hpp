#pragma once
#include <string>
#include <libsoup/soup.h>
#include "../hls/range-request.hpp"
#include "../hls/response.hpp"

void http_message_set_error(SoupMessage *msg, guint code);
void http_message_set_no_cache(SoupMessage *msg);
bool http_message_body_append_compressed_text(SoupMessageBody *message_body, const std::string &text);
// Status, headers and body of a dispatcher response; playlists are gzip-encoded.
void http_message_apply_response(SoupMessage *msg, const HLSResponse &response);

// Non-negative decimal that fits an int.
bool http_parse_directive(const gchar *text, int *value);
// SOUP_STATUS_OK, or SOUP_STATUS_BAD_REQUEST for a malformed _HLS_msn or _HLS_part.
guint http_parse_playlist_query(GHashTable *query, int *mediaSequenceNumber, int *partIndex);
// "<sequence><suffix>", e.g. "12.ts".
bool http_parse_sequence(const char *name, const char *suffix, int *sequence);
// SOUP_STATUS_OK, SOUP_STATUS_NOT_FOUND for an unknown path or
// SOUP_STATUS_REQUESTED_RANGE_NOT_SATISFIABLE for a Range header we do not serve.
guint http_parse_segment_request(const char *path, const char *rangeHeader, int *sequence,
    bool *ranged, HLSByteRange *range);
