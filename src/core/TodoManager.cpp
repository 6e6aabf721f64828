#include "keeper/core/TodoManager.hpp"

#include "keeper/data/DataError.hpp"
#include "keeper/data/JsonTodoStore.hpp"
#include "keeper/data/Logging.hpp"
#include "keeper/data/TodoStore.hpp"
#include "keeper/data/Validation.hpp"

#include <algorithm>
#include <iterator>

namespace keeper {
namespace core {

using data::Category;
using data::DataError;
using data::ErrorCode;
using data::TodoItem;

namespace {
DataError validationError(const QString &context, const QStringList &errors)
{
    return DataError(ErrorCode::Validation, QStringLiteral("%1: %2").arg(context, errors.join(QStringLiteral(", "))),
                     { { QStringLiteral("errors"), errors } });
}

DataError todoNotFound(const QString &id)
{
    return DataError(ErrorCode::TodoNotFound, QStringLiteral("Todo with ID %1 not found").arg(id),
                     { { QStringLiteral("id"), id } });
}

DataError categoryNotFound(const QString &id)
{
    return DataError(ErrorCode::CategoryNotFound, QStringLiteral("Category with ID %1 does not exist").arg(id),
                     { { QStringLiteral("categoryId"), id } });
}

DataError duplicateName(const QString &name)
{
    return DataError(ErrorCode::DuplicateName, QStringLiteral("Category name \"%1\" already exists").arg(name),
                     { { QStringLiteral("name"), name } });
}
} // namespace

template<typename Predicate>
std::vector<TodoItem> TodoManager::filterTodos(Predicate predicate) const
{
    ensureInitialized();
    std::vector<TodoItem> result;
    std::copy_if(m_todos.cbegin(), m_todos.cend(), std::back_inserter(result), predicate);
    return result;
}

TodoManager::TodoManager(ManagerConfig config)
    : m_config(std::move(config))
    , m_store(std::make_unique<data::JsonTodoStore>(m_config.store))
{
}

TodoManager::TodoManager(ManagerConfig config, std::unique_ptr<data::TodoStore> store)
    : m_config(std::move(config))
    , m_store(std::move(store))
{
    if (!m_store) {
        throw DataError(ErrorCode::InvalidConfig, QStringLiteral("TodoManager requires a store"));
    }
}

TodoManager::~TodoManager() = default;

void TodoManager::initialize()
{
    if (m_initialized) {
        qCWarning(lcKeeperManager) << "TodoManager is already initialized";
        return;
    }
    qCInfo(lcKeeperManager) << "Initializing TodoManager";

    data::StoreData loaded = m_store->load();
    m_todos = std::move(loaded.todos);
    m_categories = std::move(loaded.categories);

    const bool seedDefaults = m_categories.empty() && m_config.createDefaultCategories;
    if (seedDefaults) {
        createDefaultCategories();
    }
    recountAllCategories();

    // Listeners of the seeding save may already read from the manager.
    m_initialized = true;
    if (seedDefaults && m_config.autoSave && !m_categories.empty()) {
        try {
            saveNow();
        } catch (const DataError &) {
            m_initialized = false;
            throw;
        }
    }

    ChangeEvent event;
    event.type = EventType::DataLoaded;
    event.todos = m_todos;
    event.categories = m_categories;
    m_events.publish(event);

    qCInfo(lcKeeperManager).nospace() << "TodoManager initialized with " << m_todos.size() << " todos and "
                                      << m_categories.size() << " categories";
}

bool TodoManager::isInitialized() const
{
    return m_initialized;
}

void TodoManager::save()
{
    ensureInitialized();
    saveNow();
}

TodoItem TodoManager::addTodo(data::TodoInput input)
{
    ensureInitialized();

    const data::ValidationReport report = data::validateTodoInput(input);
    if (!report.isValid()) {
        throw validationError(QStringLiteral("Invalid todo input"), report.errors);
    }
    if (!hasCategory(input.categoryId)) {
        throw categoryNotFound(input.categoryId);
    }

    Snapshot before = snapshot();
    TodoItem todo = data::createTodo(std::move(input));
    m_todos.push_back(todo);
    recountCategory(todo.categoryId);
    commit(std::move(before));

    ChangeEvent event;
    event.type = EventType::TodoAdded;
    event.id = todo.id;
    event.todo = todo;
    m_events.publish(event);

    qCInfo(lcKeeperManager) << "Added todo:" << todo.title;
    return todo;
}

TodoItem TodoManager::updateTodo(const QString &id, const data::TodoUpdate &update)
{
    ensureInitialized();

    const auto it = findTodo(id);
    if (it == m_todos.end()) {
        throw todoNotFound(id);
    }

    data::ValidationReport report;
    if (update.title) {
        report.add(data::validateTitle(*update.title));
    }
    if (update.description) {
        report.add(data::validateDescription(*update.description));
    }
    if (update.priority) {
        report.add(data::validatePriority(*update.priority));
    }
    if (update.categoryId) {
        report.add(data::validateCategoryId(*update.categoryId));
    }
    if (update.dueDate && !update.clearDueDate) {
        report.add(data::validateDueDate(update.dueDate));
    }
    if (!report.isValid()) {
        throw validationError(QStringLiteral("Invalid todo update"), report.errors);
    }
    if (update.categoryId && !hasCategory(*update.categoryId)) {
        throw categoryNotFound(*update.categoryId);
    }

    Snapshot before = snapshot();
    TodoItem updated = *it;
    const QString oldCategoryId = updated.categoryId;

    if (update.title) {
        updated.title = *update.title;
    }
    if (update.description) {
        updated.description = *update.description;
    }
    if (update.priority) {
        updated.priority = *update.priority;
    }
    if (update.categoryId) {
        updated.categoryId = *update.categoryId;
    }
    if (update.clearDueDate) {
        updated.dueDate.reset();
    } else if (update.dueDate) {
        updated.dueDate = update.dueDate;
    }
    if (update.completed && *update.completed != updated.completed) {
        updated.completed = *update.completed;
        if (updated.completed) {
            updated.completedAt = QDateTime::currentDateTimeUtc();
        } else {
            updated.completedAt.reset();
        }
    }

    *it = updated;
    if (updated.categoryId != oldCategoryId) {
        recountCategory(oldCategoryId);
        recountCategory(updated.categoryId);
    }
    commit(std::move(before));

    ChangeEvent event;
    event.type = EventType::TodoUpdated;
    event.id = updated.id;
    event.todo = updated;
    m_events.publish(event);

    qCInfo(lcKeeperManager) << "Updated todo:" << updated.title;
    return updated;
}

void TodoManager::deleteTodo(const QString &id)
{
    ensureInitialized();

    const auto it = findTodo(id);
    if (it == m_todos.end()) {
        throw todoNotFound(id);
    }

    Snapshot before = snapshot();
    const TodoItem removed = *it;
    m_todos.erase(it);
    recountCategory(removed.categoryId);
    commit(std::move(before));

    ChangeEvent event;
    event.type = EventType::TodoDeleted;
    event.id = removed.id;
    event.todo = removed;
    m_events.publish(event);

    qCInfo(lcKeeperManager) << "Deleted todo:" << removed.title;
}

TodoItem TodoManager::toggleTodoCompletion(const QString &id)
{
    ensureInitialized();

    const auto it = findTodo(id);
    if (it == m_todos.end()) {
        throw todoNotFound(id);
    }
    data::TodoUpdate update;
    update.completed = !it->completed;
    return updateTodo(id, update);
}

std::optional<TodoItem> TodoManager::todoById(const QString &id) const
{
    ensureInitialized();
    const auto it = std::find_if(m_todos.cbegin(), m_todos.cend(),
                                 [&id](const TodoItem &todo) { return todo.id == id; });
    if (it == m_todos.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<TodoItem> TodoManager::allTodos() const
{
    ensureInitialized();
    return m_todos;
}

std::vector<TodoItem> TodoManager::todosByCategory(const QString &categoryId) const
{
    return filterTodos([&categoryId](const TodoItem &todo) { return todo.categoryId == categoryId; });
}

std::vector<TodoItem> TodoManager::todosByStatus(bool completed) const
{
    return filterTodos([completed](const TodoItem &todo) { return todo.completed == completed; });
}

std::vector<TodoItem> TodoManager::todosByPriority(data::Priority priority) const
{
    return filterTodos([priority](const TodoItem &todo) { return todo.priority == priority; });
}

std::vector<TodoItem> TodoManager::overdueTodos(const QDateTime &now) const
{
    return filterTodos([&now](const TodoItem &todo) { return todo.isOverdue(now); });
}

std::vector<TodoItem> TodoManager::searchTodos(const QString &query) const
{
    return filterTodos([&query](const TodoItem &todo) {
        return todo.title.contains(query, Qt::CaseSensitive)
            || todo.description.contains(query, Qt::CaseSensitive);
    });
}

Category TodoManager::addCategory(data::CategoryInput input)
{
    ensureInitialized();

    Snapshot before = snapshot();
    const Category category = appendCategory(std::move(input));
    commit(std::move(before));

    ChangeEvent event;
    event.type = EventType::CategoryAdded;
    event.id = category.id;
    event.category = category;
    m_events.publish(event);

    qCInfo(lcKeeperManager) << "Added category:" << category.name;
    return category;
}

Category TodoManager::updateCategory(const QString &id, const data::CategoryUpdate &update)
{
    ensureInitialized();

    const auto it = findCategory(id);
    if (it == m_categories.end()) {
        throw categoryNotFound(id);
    }

    data::ValidationReport report;
    if (update.name) {
        report.add(data::validateCategoryName(*update.name));
    }
    if (update.color) {
        report.add(data::validateCategoryColor(*update.color));
    }
    if (!report.isValid()) {
        throw validationError(QStringLiteral("Invalid category update"), report.errors);
    }
    if (update.name && !data::isCategoryNameUnique(*update.name, m_categories, id)) {
        throw duplicateName(*update.name);
    }

    Snapshot before = snapshot();
    Category updated = *it;
    if (update.name) {
        updated.name = *update.name;
    }
    if (update.color) {
        updated.color = data::normalizeColor(*update.color);
    }
    updated.todoCount = it->todoCount;
    *it = updated;
    commit(std::move(before));

    ChangeEvent event;
    event.type = EventType::CategoryUpdated;
    event.id = updated.id;
    event.category = updated;
    m_events.publish(event);

    qCInfo(lcKeeperManager) << "Updated category:" << updated.name;
    return updated;
}

void TodoManager::deleteCategory(const QString &id, const QString &reassignToId)
{
    ensureInitialized();

    const auto it = findCategory(id);
    if (it == m_categories.end()) {
        throw categoryNotFound(id);
    }
    const Category category = *it;
    const std::vector<TodoItem> todos = todosByCategory(id);

    if (!todos.empty()) {
        if (!reassignToId.isEmpty()) {
            if (reassignToId == id) {
                throw validationError(QStringLiteral("Invalid category deletion"),
                                      { QStringLiteral("Cannot move todos into the category being deleted") });
            }
            if (!hasCategory(reassignToId)) {
                throw categoryNotFound(reassignToId);
            }
            for (const TodoItem &todo : todos) {
                if (findTodo(todo.id) == m_todos.end()) {
                    continue;
                }
                data::TodoUpdate update;
                update.categoryId = reassignToId;
                updateTodo(todo.id, update);
            }
        } else {
            for (const TodoItem &todo : todos) {
                if (findTodo(todo.id) == m_todos.end()) {
                    continue;
                }
                deleteTodo(todo.id);
            }
        }
    }

    // A listener of the cascade may have removed the category already.
    const auto remaining = findCategory(id);
    if (remaining == m_categories.end()) {
        qCInfo(lcKeeperManager) << "Category already deleted:" << category.name;
        return;
    }
    Snapshot before = snapshot();
    m_categories.erase(remaining);
    commit(std::move(before));

    ChangeEvent event;
    event.type = EventType::CategoryDeleted;
    event.id = category.id;
    event.category = category;
    m_events.publish(event);

    qCInfo(lcKeeperManager) << "Deleted category:" << category.name;
}

std::optional<Category> TodoManager::categoryById(const QString &id) const
{
    ensureInitialized();
    const auto it = std::find_if(m_categories.cbegin(), m_categories.cend(),
                                 [&id](const Category &category) { return category.id == id; });
    if (it == m_categories.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Category> TodoManager::allCategories() const
{
    ensureInitialized();
    return m_categories;
}

bool TodoManager::categoryExists(const QString &id) const
{
    ensureInitialized();
    return hasCategory(id);
}

Statistics TodoManager::statistics() const
{
    ensureInitialized();

    Statistics stats;
    stats.totalTodos = static_cast<int>(m_todos.size());
    stats.totalCategories = static_cast<int>(m_categories.size());
    stats.priorityBreakdown = {
        { data::Priority::High, 0 },
        { data::Priority::Medium, 0 },
        { data::Priority::Low, 0 },
    };

    const QDateTime now = QDateTime::currentDateTimeUtc();
    for (const TodoItem &todo : m_todos) {
        if (todo.completed) {
            ++stats.completedTodos;
        } else {
            ++stats.pendingTodos;
        }
        if (todo.isOverdue(now)) {
            ++stats.overdueTodos;
        }
        ++stats.priorityBreakdown[todo.priority];
    }
    return stats;
}

SubscriptionId TodoManager::subscribe(Listener listener)
{
    return m_events.subscribe(std::move(listener));
}

bool TodoManager::unsubscribe(SubscriptionId id)
{
    return m_events.unsubscribe(id);
}

data::TodoStore &TodoManager::store()
{
    return *m_store;
}

const ManagerConfig &TodoManager::config() const
{
    return m_config;
}

void TodoManager::ensureInitialized() const
{
    if (!m_initialized) {
        throw DataError(ErrorCode::NotInitialized,
                        QStringLiteral("TodoManager must be initialized before use. Call initialize() first."));
    }
}

TodoManager::Snapshot TodoManager::snapshot() const
{
    return { m_todos, m_categories };
}

void TodoManager::commit(Snapshot before)
{
    if (!m_config.autoSave) {
        return;
    }
    try {
        saveNow();
    } catch (const DataError &error) {
        qCWarning(lcKeeperManager) << "Rolling back change after failed save:" << error.message();
        m_todos = std::move(before.todos);
        m_categories = std::move(before.categories);
        throw;
    }
}

void TodoManager::saveNow()
{
    m_store->save(m_todos, m_categories);

    ChangeEvent event;
    event.type = EventType::DataSaved;
    m_events.publish(event);
}

Category TodoManager::appendCategory(data::CategoryInput input)
{
    const data::ValidationReport report = data::validateCategoryInput(input);
    if (!report.isValid()) {
        throw validationError(QStringLiteral("Invalid category input"), report.errors);
    }
    if (!data::isCategoryNameUnique(input.name, m_categories)) {
        throw duplicateName(input.name);
    }
    Category category = data::createCategory(std::move(input));
    m_categories.push_back(category);
    return category;
}

void TodoManager::createDefaultCategories()
{
    qCInfo(lcKeeperManager) << "Creating default categories";
    for (data::CategoryInput input : data::defaultCategories()) {
        const QString name = input.name;
        try {
            appendCategory(std::move(input));
        } catch (const DataError &error) {
            qCWarning(lcKeeperManager) << "Failed to create default category" << name << ":" << error.message();
        }
    }
}

std::vector<TodoItem>::iterator TodoManager::findTodo(const QString &id)
{
    return std::find_if(m_todos.begin(), m_todos.end(), [&id](const TodoItem &todo) { return todo.id == id; });
}

std::vector<Category>::iterator TodoManager::findCategory(const QString &id)
{
    return std::find_if(m_categories.begin(), m_categories.end(),
                        [&id](const Category &category) { return category.id == id; });
}

bool TodoManager::hasCategory(const QString &id) const
{
    return std::any_of(m_categories.cbegin(), m_categories.cend(),
                       [&id](const Category &category) { return category.id == id; });
}

void TodoManager::recountCategory(const QString &categoryId)
{
    const auto it = findCategory(categoryId);
    if (it == m_categories.end()) {
        return;
    }
    const auto count = std::count_if(m_todos.cbegin(), m_todos.cend(),
                                     [&categoryId](const TodoItem &todo) { return todo.categoryId == categoryId; });
    it->todoCount = static_cast<int>(count);
}

void TodoManager::recountAllCategories()
{
    for (Category &category : m_categories) {
        recountCategory(category.id);
    }
}

} // namespace core
} // namespace keeper
