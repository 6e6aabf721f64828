#include "keeper/data/Todo.hpp"

#include <QUuid>

namespace keeper {
namespace data {

bool TodoItem::isOverdue(const QDateTime &now) const
{
    if (completed || !dueDate.has_value() || !dueDate->isValid()) {
        return false;
    }
    return *dueDate < now;
}

bool operator==(const TodoItem &lhs, const TodoItem &rhs)
{
    return lhs.id == rhs.id
        && lhs.title == rhs.title
        && lhs.description == rhs.description
        && lhs.completed == rhs.completed
        && lhs.priority == rhs.priority
        && lhs.categoryId == rhs.categoryId
        && lhs.createdAt == rhs.createdAt
        && lhs.completedAt == rhs.completedAt
        && lhs.dueDate == rhs.dueDate;
}

bool operator!=(const TodoItem &lhs, const TodoItem &rhs)
{
    return !(lhs == rhs);
}

QString createId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

TodoItem createTodo(TodoInput input)
{
    TodoItem todo;
    todo.id = createId();
    todo.title = std::move(input.title);
    todo.description = std::move(input.description);
    todo.completed = input.completed;
    todo.priority = input.priority;
    todo.categoryId = std::move(input.categoryId);
    todo.createdAt = QDateTime::currentDateTimeUtc();
    if (todo.completed) {
        todo.completedAt = todo.createdAt;
    }
    todo.dueDate = std::move(input.dueDate);
    return todo;
}

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::High:
        return QStringLiteral("high");
    case Priority::Low:
        return QStringLiteral("low");
    case Priority::Medium:
    default:
        return QStringLiteral("medium");
    }
}

std::optional<Priority> priorityFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("low")) {
        return Priority::Low;
    }
    if (normalized == QLatin1String("medium")) {
        return Priority::Medium;
    }
    if (normalized == QLatin1String("high")) {
        return Priority::High;
    }
    return std::nullopt;
}

int priorityWeight(Priority priority)
{
    switch (priority) {
    case Priority::High:
        return 3;
    case Priority::Medium:
        return 2;
    case Priority::Low:
        return 1;
    }
    return 0;
}

} // namespace data
} // namespace keeper
