#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <glib.h>

struct HLSResponse
{
    guint status;
    std::string contentType;
    std::string contentRange;
    std::string playlist;
    std::vector<std::uint8_t> data;

    explicit HLSResponse(guint status):
        status(status)
    {
    }
};
