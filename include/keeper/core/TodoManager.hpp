#pragma once

#include <QDateTime>
#include <QString>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "keeper/core/EventRegistry.hpp"
#include "keeper/core/ManagerConfig.hpp"
#include "keeper/data/Category.hpp"
#include "keeper/data/Todo.hpp"

namespace keeper {
namespace data {
class TodoStore;
}

namespace core {

struct Statistics
{
    int totalTodos = 0;
    int completedTodos = 0;
    int pendingTodos = 0;
    int overdueTodos = 0;
    int totalCategories = 0;
    std::map<data::Priority, int> priorityBreakdown;
};

/*
 * Authoritative in-memory owner of todos and categories.
 *
 * Every operation except initialize() throws DataError(NotInitialized) until
 * initialize() has completed. Mutations validate before touching state, keep
 * the per-category todo counts current, save through the store when auto-save
 * is enabled and notify subscribers afterwards. When that save fails the
 * mutation is rolled back and the error propagates.
 */
class TodoManager
{
public:
    explicit TodoManager(ManagerConfig config);
    TodoManager(ManagerConfig config, std::unique_ptr<data::TodoStore> store);
    ~TodoManager();

    void initialize();
    bool isInitialized() const;
    void save();

    data::TodoItem addTodo(data::TodoInput input);
    data::TodoItem updateTodo(const QString &id, const data::TodoUpdate &update);
    void deleteTodo(const QString &id);
    data::TodoItem toggleTodoCompletion(const QString &id);

    std::optional<data::TodoItem> todoById(const QString &id) const;
    std::vector<data::TodoItem> allTodos() const;
    std::vector<data::TodoItem> todosByCategory(const QString &categoryId) const;
    std::vector<data::TodoItem> todosByStatus(bool completed) const;
    std::vector<data::TodoItem> todosByPriority(data::Priority priority) const;
    std::vector<data::TodoItem> overdueTodos(const QDateTime &now = QDateTime::currentDateTimeUtc()) const;
    // Case-sensitive substring match on title and description.
    std::vector<data::TodoItem> searchTodos(const QString &query) const;

    data::Category addCategory(data::CategoryInput input);
    data::Category updateCategory(const QString &id, const data::CategoryUpdate &update);
    // Moves the category's todos to reassignToId when given, deletes them otherwise.
    void deleteCategory(const QString &id, const QString &reassignToId = QString());

    std::optional<data::Category> categoryById(const QString &id) const;
    std::vector<data::Category> allCategories() const;
    bool categoryExists(const QString &id) const;

    Statistics statistics() const;

    SubscriptionId subscribe(Listener listener);
    bool unsubscribe(SubscriptionId id);

    data::TodoStore &store();
    const ManagerConfig &config() const;

private:
    struct Snapshot
    {
        std::vector<data::TodoItem> todos;
        std::vector<data::Category> categories;
    };

    void ensureInitialized() const;
    Snapshot snapshot() const;
    void commit(Snapshot before);
    void saveNow();

    data::Category appendCategory(data::CategoryInput input);
    void createDefaultCategories();

    std::vector<data::TodoItem>::iterator findTodo(const QString &id);
    std::vector<data::Category>::iterator findCategory(const QString &id);
    bool hasCategory(const QString &id) const;
    void recountCategory(const QString &categoryId);
    void recountAllCategories();

    template<typename Predicate>
    std::vector<data::TodoItem> filterTodos(Predicate predicate) const;

    ManagerConfig m_config;
    std::unique_ptr<data::TodoStore> m_store;
    EventRegistry m_events;
    std::vector<data::TodoItem> m_todos;
    std::vector<data::Category> m_categories;
    bool m_initialized = false;
};

} // namespace core
} // namespace keeper
