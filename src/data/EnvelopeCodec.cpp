#include "keeper/data/EnvelopeCodec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>
#include <algorithm>

namespace keeper {
namespace data {

namespace {
bool fail(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
    return false;
}

bool isPresent(const QJsonValue &value)
{
    return !value.isUndefined() && !value.isNull();
}

bool readRequiredString(const QJsonObject &object, const QString &key, QString *out)
{
    const QJsonValue value = object.value(key);
    if (!value.isString() || value.toString().isEmpty()) {
        return false;
    }
    *out = value.toString();
    return true;
}

bool readOptionalDate(const QJsonObject &object, const QString &key, std::optional<QDateTime> *out)
{
    const QJsonValue value = object.value(key);
    if (!isPresent(value)) {
        out->reset();
        return true;
    }
    *out = decodeDate(value);
    return out->has_value();
}
} // namespace

QJsonValue encodeDate(const QDateTime &dateTime)
{
    QJsonObject wrapper;
    wrapper.insert(QLatin1String(DateDiscriminatorKey), dateTime.toUTC().toString(Qt::ISODateWithMs));
    return wrapper;
}

std::optional<QDateTime> decodeDate(const QJsonValue &value)
{
    if (!value.isObject()) {
        return std::nullopt;
    }
    const QJsonObject wrapper = value.toObject();
    const QJsonValue encoded = wrapper.value(QLatin1String(DateDiscriminatorKey));
    if (wrapper.size() != 1 || !encoded.isString()) {
        return std::nullopt;
    }
    const QDateTime dateTime = QDateTime::fromString(encoded.toString(), Qt::ISODateWithMs);
    if (!dateTime.isValid()) {
        return std::nullopt;
    }
    return dateTime.toUTC();
}

QJsonObject encodeTodo(const TodoItem &todo)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), todo.id);
    object.insert(QStringLiteral("title"), todo.title);
    if (!todo.description.isEmpty()) {
        object.insert(QStringLiteral("description"), todo.description);
    }
    object.insert(QStringLiteral("completed"), todo.completed);
    object.insert(QStringLiteral("priority"), priorityToString(todo.priority));
    object.insert(QStringLiteral("categoryId"), todo.categoryId);
    object.insert(QStringLiteral("createdAt"), encodeDate(todo.createdAt));
    if (todo.completedAt.has_value()) {
        object.insert(QStringLiteral("completedAt"), encodeDate(*todo.completedAt));
    }
    if (todo.dueDate.has_value()) {
        object.insert(QStringLiteral("dueDate"), encodeDate(*todo.dueDate));
    }
    return object;
}

QJsonObject encodeCategory(const Category &category)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), category.id);
    object.insert(QStringLiteral("name"), category.name);
    object.insert(QStringLiteral("color"), category.color);
    object.insert(QStringLiteral("todoCount"), category.todoCount);
    return object;
}

QJsonObject encodeEnvelope(const Envelope &envelope)
{
    QJsonArray todos;
    for (const TodoItem &todo : envelope.todos) {
        todos.append(encodeTodo(todo));
    }
    QJsonArray categories;
    for (const Category &category : envelope.categories) {
        categories.append(encodeCategory(category));
    }

    QJsonObject object;
    object.insert(QStringLiteral("todos"), todos);
    object.insert(QStringLiteral("categories"), categories);
    object.insert(QStringLiteral("version"), envelope.version);
    if (envelope.lastModified.isValid()) {
        object.insert(QStringLiteral("lastModified"), encodeDate(envelope.lastModified));
    }
    return object;
}

QJsonObject encodeExport(const Envelope &envelope, const QDateTime &exportDate)
{
    const auto completed = std::count_if(envelope.todos.cbegin(), envelope.todos.cend(),
                                         [](const TodoItem &todo) { return todo.completed; });

    QJsonObject summary;
    summary.insert(QStringLiteral("totalTodos"), static_cast<int>(envelope.todos.size()));
    summary.insert(QStringLiteral("completedTodos"), static_cast<int>(completed));
    summary.insert(QStringLiteral("totalCategories"), static_cast<int>(envelope.categories.size()));

    const QJsonObject full = encodeEnvelope(envelope);
    QJsonObject object;
    object.insert(QStringLiteral("exportDate"), encodeDate(exportDate));
    object.insert(QStringLiteral("summary"), summary);
    object.insert(QStringLiteral("categories"), full.value(QStringLiteral("categories")));
    object.insert(QStringLiteral("todos"), full.value(QStringLiteral("todos")));
    return object;
}

bool decodeTodo(const QJsonValue &value, TodoItem *todo, QString *error)
{
    if (!value.isObject()) {
        return fail(error, QStringLiteral("Todo must be an object"));
    }
    const QJsonObject object = value.toObject();
    TodoItem result;

    if (!readRequiredString(object, QStringLiteral("id"), &result.id)) {
        return fail(error, QStringLiteral("Todo must have a valid id"));
    }
    if (!readRequiredString(object, QStringLiteral("title"), &result.title)) {
        return fail(error, QStringLiteral("Todo must have a valid title"));
    }

    const QJsonValue description = object.value(QStringLiteral("description"));
    if (isPresent(description)) {
        if (!description.isString()) {
            return fail(error, QStringLiteral("Todo description must be a string"));
        }
        result.description = description.toString();
    }

    const QJsonValue completed = object.value(QStringLiteral("completed"));
    if (!completed.isBool()) {
        return fail(error, QStringLiteral("Todo completed status must be a boolean"));
    }
    result.completed = completed.toBool();

    QString priorityName;
    if (!readRequiredString(object, QStringLiteral("priority"), &priorityName)) {
        return fail(error, QStringLiteral("Todo must have a valid priority"));
    }
    const auto priority = priorityFromString(priorityName);
    if (!priority.has_value()) {
        return fail(error, QStringLiteral("Unknown todo priority \"%1\"").arg(priorityName));
    }
    result.priority = *priority;

    if (!readRequiredString(object, QStringLiteral("categoryId"), &result.categoryId)) {
        return fail(error, QStringLiteral("Todo must have a valid categoryId"));
    }

    const auto createdAt = decodeDate(object.value(QStringLiteral("createdAt")));
    if (!createdAt.has_value()) {
        return fail(error, QStringLiteral("Todo must have a valid createdAt date"));
    }
    result.createdAt = *createdAt;

    if (!readOptionalDate(object, QStringLiteral("completedAt"), &result.completedAt)) {
        return fail(error, QStringLiteral("Todo completedAt must be a date"));
    }
    if (!readOptionalDate(object, QStringLiteral("dueDate"), &result.dueDate)) {
        return fail(error, QStringLiteral("Todo dueDate must be a date"));
    }

    *todo = std::move(result);
    return true;
}

bool decodeCategory(const QJsonValue &value, Category *category, QString *error)
{
    if (!value.isObject()) {
        return fail(error, QStringLiteral("Category must be an object"));
    }
    const QJsonObject object = value.toObject();
    Category result;

    if (!readRequiredString(object, QStringLiteral("id"), &result.id)) {
        return fail(error, QStringLiteral("Category must have a valid id"));
    }
    if (!readRequiredString(object, QStringLiteral("name"), &result.name)) {
        return fail(error, QStringLiteral("Category must have a valid name"));
    }
    if (!readRequiredString(object, QStringLiteral("color"), &result.color)) {
        return fail(error, QStringLiteral("Category must have a valid color"));
    }
    const QJsonValue todoCount = object.value(QStringLiteral("todoCount"));
    if (!todoCount.isDouble()) {
        return fail(error, QStringLiteral("Category todoCount must be a number"));
    }
    result.todoCount = todoCount.toInt();

    *category = std::move(result);
    return true;
}

bool decodeEnvelope(const QJsonObject &object, Envelope *envelope, QString *error)
{
    const QJsonValue todos = object.value(QStringLiteral("todos"));
    if (!todos.isArray()) {
        return fail(error, QStringLiteral("todos must be an array"));
    }
    const QJsonValue categories = object.value(QStringLiteral("categories"));
    if (!categories.isArray()) {
        return fail(error, QStringLiteral("categories must be an array"));
    }
    const QJsonValue version = object.value(QStringLiteral("version"));
    if (!version.isString() || version.toString().isEmpty()) {
        return fail(error, QStringLiteral("version must be a string"));
    }

    Envelope result;
    result.version = version.toString();
    if (const auto lastModified = decodeDate(object.value(QStringLiteral("lastModified")))) {
        result.lastModified = *lastModified;
    }

    const QJsonArray todoArray = todos.toArray();
    result.todos.reserve(static_cast<size_t>(todoArray.size()));
    for (int i = 0; i < todoArray.size(); ++i) {
        TodoItem todo;
        QString reason;
        if (!decodeTodo(todoArray.at(i), &todo, &reason)) {
            return fail(error, QStringLiteral("Invalid todo at index %1: %2").arg(i).arg(reason));
        }
        result.todos.push_back(std::move(todo));
    }

    const QJsonArray categoryArray = categories.toArray();
    result.categories.reserve(static_cast<size_t>(categoryArray.size()));
    for (int i = 0; i < categoryArray.size(); ++i) {
        Category category;
        QString reason;
        if (!decodeCategory(categoryArray.at(i), &category, &reason)) {
            return fail(error, QStringLiteral("Invalid category at index %1: %2").arg(i).arg(reason));
        }
        result.categories.push_back(std::move(category));
    }

    if (envelope) {
        *envelope = std::move(result);
    }
    return true;
}

bool parseEnvelope(const QByteArray &payload, Envelope *envelope, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(error, QStringLiteral("Malformed JSON at offset %1: %2")
                               .arg(parseError.offset)
                               .arg(parseError.errorString()));
    }
    if (!document.isObject()) {
        return fail(error, QStringLiteral("Data must be an object"));
    }
    return decodeEnvelope(document.object(), envelope, error);
}

QByteArray serializeEnvelope(const Envelope &envelope)
{
    return QJsonDocument(encodeEnvelope(envelope)).toJson(QJsonDocument::Indented);
}

std::vector<TodoItem> danglingCategoryReferences(const Envelope &envelope)
{
    QSet<QString> categoryIds;
    for (const Category &category : envelope.categories) {
        categoryIds.insert(category.id);
    }
    std::vector<TodoItem> dangling;
    for (const TodoItem &todo : envelope.todos) {
        if (!categoryIds.contains(todo.categoryId)) {
            dangling.push_back(todo);
        }
    }
    return dangling;
}

} // namespace data
} // namespace keeper
