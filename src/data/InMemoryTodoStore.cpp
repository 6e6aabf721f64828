#include "keeper/data/InMemoryTodoStore.hpp"

#include "keeper/data/DataError.hpp"
#include "keeper/data/EnvelopeCodec.hpp"

#include <QFile>
#include <QJsonDocument>

namespace keeper {
namespace data {

InMemoryTodoStore::InMemoryTodoStore() = default;

InMemoryTodoStore::InMemoryTodoStore(StoreData initial)
    : m_data(std::move(initial))
    , m_hasData(true)
{
}

InMemoryTodoStore::~InMemoryTodoStore() = default;

void InMemoryTodoStore::save(const std::vector<TodoItem> &todos, const std::vector<Category> &categories)
{
    if (m_failSaves) {
        throw DataError(ErrorCode::Save, QStringLiteral("Failed to save data: storage unavailable"));
    }
    m_data.todos = todos;
    m_data.categories = categories;
    m_hasData = true;
    m_lastModified = QDateTime::currentDateTimeUtc();
    ++m_saveCount;
}

StoreData InMemoryTodoStore::load()
{
    return m_data;
}

QString InMemoryTodoStore::backup()
{
    return {};
}

StoreStats InMemoryTodoStore::stats() const
{
    StoreStats stats;
    stats.exists = m_hasData;
    stats.lastModified = m_lastModified;
    return stats;
}

void InMemoryTodoStore::exportTo(const QString &path)
{
    Envelope envelope;
    envelope.todos = m_data.todos;
    envelope.categories = m_data.categories;

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw DataError(ErrorCode::Export, QStringLiteral("Failed to export data: %1").arg(file.errorString()),
                        { { QStringLiteral("path"), path } });
    }
    const QByteArray payload = QJsonDocument(encodeExport(envelope, QDateTime::currentDateTimeUtc())).toJson();
    if (file.write(payload) != payload.size()) {
        throw DataError(ErrorCode::Export, QStringLiteral("Failed to export data: %1").arg(file.errorString()),
                        { { QStringLiteral("path"), path } });
    }
}

const StoreData &InMemoryTodoStore::data() const
{
    return m_data;
}

int InMemoryTodoStore::saveCount() const
{
    return m_saveCount;
}

void InMemoryTodoStore::setFailSaves(bool fail)
{
    m_failSaves = fail;
}

} // namespace data
} // namespace keeper
