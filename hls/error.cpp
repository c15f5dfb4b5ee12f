#include "error.hpp"

G_DEFINE_QUARK(hls-buffer-error-quark, hls_buffer_error)
