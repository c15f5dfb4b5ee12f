#pragma once
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <libsoup/soup.h>

// A request whose response is not ready yet; its SoupMessage stays paused meanwhile.
struct PendingMessage
{
    SoupMessage *msg;
    bool paused;
    bool processed;
    std::function<void()> cancel;

    explicit PendingMessage(SoupMessage *msg);
    // Marks the message answered and drops the request it kept alive.
    void finish();
};

class PendingMessageList
{
public:
    void add(std::shared_ptr<PendingMessage> pending);
    // Cancels the request behind a message whose client went away.
    bool abort(SoupMessage *msg);
    void cancelAll();
    void removeProcessed();
    std::size_t size() const;
private:
    std::list<std::shared_ptr<PendingMessage>> messages;
};
