#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace engine::core
{
struct Event
{
    std::string name;
    std::vector<std::string> args;
};

class EventBus
{
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId Subscribe(const std::string& eventName, Handler handler);
    bool Unsubscribe(SubscriptionId id);

    void Publish(Event event);
    void DispatchQueued();

    // Drops queued events and all subscriptions.
    void Clear();

    [[nodiscard]] std::size_t PendingCount() const { return m_queue.size(); }

private:
    struct Subscription
    {
        SubscriptionId id = 0;
        Handler handler;
    };

    SubscriptionId m_nextSubscription = 1;
    std::unordered_map<std::string, std::vector<Subscription>> m_handlers;
    std::queue<Event> m_queue;
};
} // namespace engine::core
