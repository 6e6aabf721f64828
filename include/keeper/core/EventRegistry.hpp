#pragma once

#include <QString>
#include <QtGlobal>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "keeper/data/Category.hpp"
#include "keeper/data/Todo.hpp"

namespace keeper {
namespace core {

enum class EventType
{
    TodoAdded,
    TodoUpdated,
    TodoDeleted,
    CategoryAdded,
    CategoryUpdated,
    CategoryDeleted,
    DataLoaded,
    DataSaved,
};

// "todo-added", "category-deleted", ...
QString eventName(EventType type);

struct ChangeEvent
{
    EventType type = EventType::DataSaved;
    // Id of the affected record; set for todo and category events.
    QString id;
    std::optional<data::TodoItem> todo;
    std::optional<data::Category> category;
    // Full record sets; set for DataLoaded only.
    std::vector<data::TodoItem> todos;
    std::vector<data::Category> categories;
};

using Listener = std::function<void(const ChangeEvent &)>;
using SubscriptionId = quint64;

class EventRegistry
{
public:
    EventRegistry();
    ~EventRegistry();

    SubscriptionId subscribe(Listener listener);
    bool unsubscribe(SubscriptionId id);

    // Delivers to every subscriber in subscription order. A throwing listener is
    // logged and skipped; the remaining listeners still receive the event.
    void publish(const ChangeEvent &event) const;

    std::size_t count() const;

private:
    struct Subscriber
    {
        SubscriptionId id = 0;
        Listener listener;
    };

    std::vector<Subscriber> m_subscribers;
    SubscriptionId m_nextId = 1;
};

} // namespace core
} // namespace keeper
