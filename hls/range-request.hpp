#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include "buffer.hpp"
#include "response.hpp"

// Largest exact integer in a double; players use it as "until the end of the data".
#define HLS_BYTE_RANGE_OPEN_END G_GUINT64_CONSTANT(9007199254740991)
#define HLS_SEGMENT_CONTENT_TYPE "video/mp2t"

struct HLSByteRange
{
    std::uint64_t start;
    std::uint64_t end;

    HLSByteRange();
    HLSByteRange(std::uint64_t start, std::uint64_t end);
    bool isOpenEnded() const;

    // Parses a single "bytes=<start>-[<end>]" range; suffix and multiple ranges are not accepted.
    static bool parse(const char *header, HLSByteRange *range);
};

// Byte delivery for a segment that may still be growing.
class HLSRangeRequest: public std::enable_shared_from_this<HLSRangeRequest>
{
public:
    typedef std::function<void(const HLSResponse &)> Callback;
    HLSRangeRequest(std::shared_ptr<HLSBuffer> buffer, int sequence, Callback callback);
    HLSRangeRequest(std::shared_ptr<HLSBuffer> buffer, int sequence, const HLSByteRange &range, Callback callback);

    void dispatch();
    void cancel();
    bool isProcessed() const;
    bool isBlocked() const;
    struct Private;
private:
    void wait(const HLSCondition &condition);
    void respond(const HLSResponse &response);
    std::shared_ptr<Private> priv;
};
