#include "pending-message.hpp"

PendingMessage::PendingMessage(SoupMessage *msg):
    msg(msg),
    paused(false),
    processed(false)
{
}

void PendingMessage::finish()
{
    processed = true;
    cancel = nullptr;
}

void PendingMessageList::add(std::shared_ptr<PendingMessage> pending)
{
    messages.push_back(pending);
}

bool PendingMessageList::abort(SoupMessage *msg)
{
    bool aborted = false;
    for (auto &pending: messages)
    {
        if (pending->msg == msg && !pending->processed)
        {
            if (pending->cancel)
            {
                pending->cancel();
            }
            pending->finish();
            aborted = true;
        }
    }
    removeProcessed();
    return aborted;
}

void PendingMessageList::cancelAll()
{
    for (auto &pending: messages)
    {
        if (!pending->processed)
        {
            if (pending->cancel)
            {
                pending->cancel();
            }
            pending->finish();
        }
    }
    messages.clear();
}

void PendingMessageList::removeProcessed()
{
    messages.remove_if([](std::shared_ptr<PendingMessage> &pending) { return pending->processed; });
}

std::size_t PendingMessageList::size() const
{
    return messages.size();
}
