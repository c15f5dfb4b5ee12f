#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>

class HLSBuffer;

enum class HLSEvent
{
    SegmentPut,
    PartAppended,
    SegmentSealed,
    Stopped
};

enum class HLSWaitResult
{
    Pending,
    Ready,
    Stale,
    Stopped
};

struct HLSCondition
{
    enum class Type
    {
        // Segment `sequence` is in the window; a negative sequence matches any segment.
        SegmentExists,
        // Like SegmentExists, but gives up on the next appended part.
        SegmentAppears,
        // Part `part` of segment `sequence`, after rollover normalization.
        PartAvailable,
        // Segment `sequence` holds more than `offset` bytes, or is complete.
        BytesAvailable
    };

    Type type;
    int sequence;
    int part;
    std::uint64_t offset;

    static HLSCondition segmentExists(int sequence);
    static HLSCondition segmentAppears(int sequence);
    static HLSCondition partAvailable(int sequence, int part);
    static HLSCondition bytesAvailable(int sequence, std::uint64_t offset);

    HLSWaitResult check(const HLSBuffer &buffer, HLSEvent event) const;

    // Moves a rolled-over part key onto the next segment for good, so the key
    // survives eviction of the segment it was first expressed against.
    void rebase(const HLSBuffer &buffer);

    // A part index past the end of a complete segment addresses part 0 of the next one.
    static void normalizePart(const HLSBuffer &buffer, int *sequence, int *part);
};

class HLSWaiter
{
public:
    typedef std::function<void(HLSWaitResult)> Callback;
    HLSWaiter(const HLSCondition &condition, Callback callback);
    const HLSCondition &getCondition() const;
    HLSWaitResult check(const HLSBuffer &buffer, HLSEvent event);
    void resolve(HLSWaitResult result);
private:
    HLSCondition condition;
    Callback callback;
    bool resolved;
};

class HLSWaiterRegistry
{
public:
    HLSWaiterRegistry();
    std::shared_ptr<HLSWaiter> add(const HLSCondition &condition, HLSWaiter::Callback callback);
    void remove(const std::shared_ptr<HLSWaiter> &waiter);
    void broadcast(const HLSBuffer &buffer, HLSEvent event);
    std::size_t size() const;
    struct Private;
private:
    std::shared_ptr<Private> priv;
};
