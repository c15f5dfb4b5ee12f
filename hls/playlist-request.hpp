#pragma once
#include <functional>
#include <memory>
#include <string>
#include "buffer.hpp"
#include "playlist.hpp"
#include "response.hpp"

#define HLS_PLAYLIST_CONTENT_TYPE "application/vnd.apple.mpegURL"

// Blocking playlist reload: answers _HLS_msn/_HLS_part requests once the buffer can satisfy them.
// A negative mediaSequenceNumber or partIndex means the directive was not given.
class HLSPlaylistRequest: public std::enable_shared_from_this<HLSPlaylistRequest>
{
public:
    typedef std::function<void(const HLSResponse &)> Callback;
    HLSPlaylistRequest(std::shared_ptr<HLSBuffer> buffer, int mediaSequenceNumber, int partIndex,
        Callback callback, const std::string &uriPrefix = HLS_DEFAULT_URI_PREFIX);

    void dispatch();
    void cancel();
    bool isProcessed() const;
    bool isBlocked() const;
    struct Private;
private:
    void wait(const HLSCondition &condition);
    void serve();
    void reject(guint status);
    std::shared_ptr<Private> priv;
};
