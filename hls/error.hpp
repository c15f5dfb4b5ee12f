#pragma once
#include <glib.h>

G_BEGIN_DECLS

#define HLS_BUFFER_ERROR hls_buffer_error_quark()

typedef enum
{
    HLS_BUFFER_ERROR_SEALED_SEGMENT,
    HLS_BUFFER_ERROR_UNSEALED_SEGMENT,
    HLS_BUFFER_ERROR_EMPTY_PART,
    HLS_BUFFER_ERROR_NOT_FOUND,
    HLS_BUFFER_ERROR_SEQUENCE,
    HLS_BUFFER_ERROR_STOPPED,
    HLS_BUFFER_ERROR_INVALID_SETTINGS
} HLSBufferError;

GQuark hls_buffer_error_quark(void);

G_END_DECLS
