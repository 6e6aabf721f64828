#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>
#include <vector>

#include "keeper/data/Category.hpp"
#include "keeper/data/Todo.hpp"

namespace keeper {
namespace data {

struct StoreData
{
    std::vector<TodoItem> todos;
    std::vector<Category> categories;
};

struct StoreStats
{
    bool exists = false;
    qint64 size = 0;
    QDateTime lastModified;
    int backupCount = 0;
};

// Durable home of the record sets. Failures are reported as DataError.
class TodoStore
{
public:
    virtual ~TodoStore() = default;

    virtual void save(const std::vector<TodoItem> &todos, const std::vector<Category> &categories) = 0;
    virtual StoreData load() = 0;
    // Returns the path of the created backup, or an empty string if none was made.
    virtual QString backup() = 0;
    virtual StoreStats stats() const = 0;
    virtual void exportTo(const QString &path) = 0;
};

} // namespace data
} // namespace keeper
