#pragma once

#include "keeper/data/TodoStore.hpp"

namespace keeper {
namespace data {

class InMemoryTodoStore : public TodoStore
{
public:
    InMemoryTodoStore();
    explicit InMemoryTodoStore(StoreData initial);
    ~InMemoryTodoStore() override;

    void save(const std::vector<TodoItem> &todos, const std::vector<Category> &categories) override;
    StoreData load() override;
    QString backup() override;
    StoreStats stats() const override;
    void exportTo(const QString &path) override;

    const StoreData &data() const;
    int saveCount() const;
    void setFailSaves(bool fail);

private:
    StoreData m_data;
    bool m_hasData = false;
    bool m_failSaves = false;
    int m_saveCount = 0;
    QDateTime m_lastModified;
};

} // namespace data
} // namespace keeper
