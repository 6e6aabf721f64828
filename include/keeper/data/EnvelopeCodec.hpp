#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "keeper/data/Category.hpp"
#include "keeper/data/Todo.hpp"

namespace keeper {
namespace data {

constexpr const char *CurrentEnvelopeVersion = "1.0.0";

// Timestamps are written as {"__date": "<ISO-8601>"}. Only fields declared as
// timestamps are decoded through this wrapper, so the key cannot collide with
// user text.
constexpr const char *DateDiscriminatorKey = "__date";

struct Envelope
{
    std::vector<TodoItem> todos;
    std::vector<Category> categories;
    QString version;
    QDateTime lastModified;
};

QJsonValue encodeDate(const QDateTime &dateTime);
std::optional<QDateTime> decodeDate(const QJsonValue &value);

QJsonObject encodeTodo(const TodoItem &todo);
QJsonObject encodeCategory(const Category &category);
QJsonObject encodeEnvelope(const Envelope &envelope);
QJsonObject encodeExport(const Envelope &envelope, const QDateTime &exportDate);

bool decodeTodo(const QJsonValue &value, TodoItem *todo, QString *error);
bool decodeCategory(const QJsonValue &value, Category *category, QString *error);
bool decodeEnvelope(const QJsonObject &object, Envelope *envelope, QString *error);

// Parses and structurally validates a serialized envelope.
bool parseEnvelope(const QByteArray &payload, Envelope *envelope, QString *error);
// Indented JSON, the on-disk form of the data file.
QByteArray serializeEnvelope(const Envelope &envelope);

// Todos whose categoryId names no category in the envelope.
std::vector<TodoItem> danglingCategoryReferences(const Envelope &envelope);

} // namespace data
} // namespace keeper
