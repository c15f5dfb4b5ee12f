#include "waiter.hpp"
#include <utility>
#include "buffer.hpp"

HLSCondition HLSCondition::segmentExists(int sequence)
{
    HLSCondition condition;
    condition.type = Type::SegmentExists;
    condition.sequence = sequence;
    condition.part = -1;
    condition.offset = 0;
    return condition;
}

HLSCondition HLSCondition::segmentAppears(int sequence)
{
    HLSCondition condition = segmentExists(sequence);
    condition.type = Type::SegmentAppears;
    return condition;
}

HLSCondition HLSCondition::partAvailable(int sequence, int part)
{
    HLSCondition condition = segmentExists(sequence);
    condition.type = Type::PartAvailable;
    condition.part = part;
    return condition;
}

HLSCondition HLSCondition::bytesAvailable(int sequence, std::uint64_t offset)
{
    HLSCondition condition = segmentExists(sequence);
    condition.type = Type::BytesAvailable;
    condition.offset = offset;
    return condition;
}

void HLSCondition::normalizePart(const HLSBuffer &buffer, int *sequence, int *part)
{
    std::shared_ptr<const HLSSegment> segment = buffer.getSegment(*sequence);
    while (segment && segment->isComplete() && *part >= segment->getPartCount())
    {
        (*sequence)++;
        *part = 0;
        segment = buffer.getSegment(*sequence);
    }
}

void HLSCondition::rebase(const HLSBuffer &buffer)
{
    if (type == Type::PartAvailable)
    {
        normalizePart(buffer, &sequence, &part);
    }
}

HLSWaitResult HLSCondition::check(const HLSBuffer &buffer, HLSEvent event) const
{
    if (event == HLSEvent::Stopped || buffer.isStopped())
    {
        return HLSWaitResult::Stopped;
    }

    int targetSequence = sequence;
    int targetPart = part;
    if (type == Type::PartAvailable)
    {
        normalizePart(buffer, &targetSequence, &targetPart);
    }
    if (type == Type::SegmentExists && targetSequence < 0)
    {
        return buffer.current() ? HLSWaitResult::Ready : HLSWaitResult::Pending;
    }

    std::shared_ptr<const HLSSegment> segment = buffer.getSegment(targetSequence);
    if (!segment)
    {
        if (targetSequence <= buffer.lastSequence())
        {
            // Evicted while we were waiting.
            return HLSWaitResult::Stale;
        }
        if (type == Type::SegmentAppears && event == HLSEvent::PartAppended)
        {
            return HLSWaitResult::Stale;
        }
        return HLSWaitResult::Pending;
    }

    switch (type)
    {
    case Type::SegmentExists:
    case Type::SegmentAppears:
        return HLSWaitResult::Ready;
    case Type::PartAvailable:
        return segment->getPartCount() > targetPart ? HLSWaitResult::Ready : HLSWaitResult::Pending;
    case Type::BytesAvailable:
        return (segment->getDataSize() > offset || segment->isComplete()) ?
            HLSWaitResult::Ready : HLSWaitResult::Pending;
    }
    return HLSWaitResult::Pending;
}

HLSWaiter::HLSWaiter(const HLSCondition &condition, Callback callback):
    condition(condition),
    callback(callback),
    resolved(false)
{
}

const HLSCondition &HLSWaiter::getCondition() const
{
    return condition;
}

HLSWaitResult HLSWaiter::check(const HLSBuffer &buffer, HLSEvent event)
{
    condition.rebase(buffer);
    return condition.check(buffer, event);
}

void HLSWaiter::resolve(HLSWaitResult result)
{
    if (resolved || result == HLSWaitResult::Pending)
    {
        return;
    }
    resolved = true;
    Callback resolvedCallback;
    resolvedCallback.swap(callback);
    resolvedCallback(result);
}

struct HLSWaiterRegistry::Private
{
    std::list<std::shared_ptr<HLSWaiter>> waiters;
};

HLSWaiterRegistry::HLSWaiterRegistry():
    priv(std::make_shared<Private>())
{
}

std::shared_ptr<HLSWaiter> HLSWaiterRegistry::add(const HLSCondition &condition, HLSWaiter::Callback callback)
{
    std::shared_ptr<HLSWaiter> waiter = std::make_shared<HLSWaiter>(condition, callback);
    priv->waiters.push_back(waiter);
    return waiter;
}

void HLSWaiterRegistry::remove(const std::shared_ptr<HLSWaiter> &waiter)
{
    priv->waiters.remove(waiter);
}

void HLSWaiterRegistry::broadcast(const HLSBuffer &buffer, HLSEvent event)
{
    // Only waiters registered before this mutation are checked; callbacks may register new ones.
    std::list<std::shared_ptr<HLSWaiter>> waiting;
    waiting.swap(priv->waiters);
    std::list<std::pair<std::shared_ptr<HLSWaiter>, HLSWaitResult>> resolved;
    for (auto &waiter: waiting)
    {
        HLSWaitResult result = waiter->check(buffer, event);
        if (result == HLSWaitResult::Pending)
        {
            priv->waiters.push_back(waiter);
        }
        else
        {
            resolved.push_back(std::make_pair(waiter, result));
        }
    }
    for (auto &entry: resolved)
    {
        entry.first->resolve(entry.second);
    }
}

std::size_t HLSWaiterRegistry::size() const
{
    return priv->waiters.size();
}
