#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace keeper {
namespace data {

enum class Priority
{
    Low,
    Medium,
    High,
};

struct TodoItem
{
    QString id;
    QString title;
    QString description;
    bool completed = false;
    Priority priority = Priority::Medium;
    QString categoryId;
    QDateTime createdAt;
    std::optional<QDateTime> completedAt;
    std::optional<QDateTime> dueDate;

    bool isOverdue(const QDateTime &now = QDateTime::currentDateTimeUtc()) const;
};

bool operator==(const TodoItem &lhs, const TodoItem &rhs);
bool operator!=(const TodoItem &lhs, const TodoItem &rhs);

struct TodoInput
{
    QString title;
    QString description;
    bool completed = false;
    Priority priority = Priority::Medium;
    QString categoryId;
    std::optional<QDateTime> dueDate;
};

// Only the engaged fields are applied.
struct TodoUpdate
{
    std::optional<QString> title;
    std::optional<QString> description;
    std::optional<bool> completed;
    std::optional<Priority> priority;
    std::optional<QString> categoryId;
    std::optional<QDateTime> dueDate;
    bool clearDueDate = false;
};

QString createId();
TodoItem createTodo(TodoInput input);

QString priorityToString(Priority priority);
std::optional<Priority> priorityFromString(const QString &value);
int priorityWeight(Priority priority);

} // namespace data
} // namespace keeper
