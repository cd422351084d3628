#include "engine/core/EventBus.hpp"

#include <algorithm>
#include <utility>

namespace engine::core
{
EventBus::SubscriptionId EventBus::Subscribe(const std::string& eventName, Handler handler)
{
    const SubscriptionId id = m_nextSubscription++;
    m_handlers[eventName].push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::Unsubscribe(SubscriptionId id)
{
    for (auto& [name, subscriptions] : m_handlers)
    {
        const auto it = std::find_if(subscriptions.begin(), subscriptions.end(), [id](const Subscription& sub) {
            return sub.id == id;
        });
        if (it != subscriptions.end())
        {
            subscriptions.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::Publish(Event event)
{
    m_queue.push(std::move(event));
}

void EventBus::DispatchQueued()
{
    while (!m_queue.empty())
    {
        Event event = std::move(m_queue.front());
        m_queue.pop();

        const auto it = m_handlers.find(event.name);
        if (it == m_handlers.end())
        {
            continue;
        }

        // Handlers may subscribe while dispatching; iterate a snapshot.
        const std::vector<Subscription> subscriptions = it->second;
        for (const Subscription& sub : subscriptions)
        {
            sub.handler(event);
        }
    }
}

void EventBus::Clear()
{
    m_handlers.clear();
    m_queue = {};
}
} // namespace engine::core
