#pragma once
#include <memory>
#include <libsoup/soup.h>
#include "../hls/buffer.hpp"

class HTTPAPI
{
public:
    HTTPAPI(const int port, std::shared_ptr<HLSBuffer> buffer, bool verbose = false);
    virtual ~HTTPAPI();
    struct Private;
private:
    std::shared_ptr<Private> priv;
};
