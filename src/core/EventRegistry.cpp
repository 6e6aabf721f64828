#include "keeper/core/EventRegistry.hpp"

#include "keeper/data/Logging.hpp"

#include <algorithm>
#include <exception>

namespace keeper {
namespace core {

QString eventName(EventType type)
{
    switch (type) {
    case EventType::TodoAdded:
        return QStringLiteral("todo-added");
    case EventType::TodoUpdated:
        return QStringLiteral("todo-updated");
    case EventType::TodoDeleted:
        return QStringLiteral("todo-deleted");
    case EventType::CategoryAdded:
        return QStringLiteral("category-added");
    case EventType::CategoryUpdated:
        return QStringLiteral("category-updated");
    case EventType::CategoryDeleted:
        return QStringLiteral("category-deleted");
    case EventType::DataLoaded:
        return QStringLiteral("data-loaded");
    case EventType::DataSaved:
        return QStringLiteral("data-saved");
    }
    return QString();
}

EventRegistry::EventRegistry() = default;
EventRegistry::~EventRegistry() = default;

SubscriptionId EventRegistry::subscribe(Listener listener)
{
    if (!listener) {
        return 0;
    }
    const SubscriptionId id = m_nextId++;
    m_subscribers.push_back({ id, std::move(listener) });
    return id;
}

bool EventRegistry::unsubscribe(SubscriptionId id)
{
    const auto it = std::find_if(m_subscribers.begin(), m_subscribers.end(),
                                 [id](const Subscriber &subscriber) { return subscriber.id == id; });
    if (it == m_subscribers.end()) {
        return false;
    }
    m_subscribers.erase(it);
    return true;
}

void EventRegistry::publish(const ChangeEvent &event) const
{
    // Listeners may (un)subscribe while being notified.
    const auto subscribers = m_subscribers;
    for (const Subscriber &subscriber : subscribers) {
        try {
            subscriber.listener(event);
        } catch (const std::exception &error) {
            qCWarning(lcKeeperManager) << "Listener" << subscriber.id << "failed on"
                                       << eventName(event.type) << ":" << error.what();
        } catch (...) {
            qCWarning(lcKeeperManager) << "Listener" << subscriber.id << "failed on"
                                       << eventName(event.type) << "with a non-standard exception";
        }
    }
}

std::size_t EventRegistry::count() const
{
    return m_subscribers.size();
}

} // namespace core
} // namespace keeper
