#include "keeper/data/JsonTodoStore.hpp"

#include "keeper/data/DataError.hpp"
#include "keeper/data/EnvelopeCodec.hpp"
#include "keeper/data/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <algorithm>

namespace keeper {
namespace data {

namespace {
constexpr auto BACKUP_PREFIX = "todos-backup-";
constexpr auto BACKUP_SUFFIX = ".json";
constexpr auto BACKUP_STAMP_FORMAT = "yyyy-MM-dd'T'HH-mm-ss-zzz'Z'";
constexpr int BACKUP_SEQUENCE_LIMIT = 1000;

bool ensureDirectory(const QString &path)
{
    QDir dir(path);
    return dir.exists() || dir.mkpath(QStringLiteral("."));
}

bool readFile(const QString &path, QByteArray *payload, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    *payload = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        *error = QStringLiteral("Cannot read %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

int backupSequence(const QString &fileName, const QString &stampedPrefix)
{
    const QString rest = fileName.mid(stampedPrefix.size() + 1);
    bool ok = false;
    const int sequence = rest.left(rest.size() - int(qstrlen(BACKUP_SUFFIX))).toInt(&ok);
    return ok ? sequence : -1;
}
} // namespace

JsonTodoStore::JsonTodoStore(StoreConfig config)
    : m_config(std::move(config))
{
    m_config.validate();

    const QString dataDir = QFileInfo(m_config.dataPath).absolutePath();
    if (!ensureDirectory(dataDir)) {
        qCWarning(lcKeeperStore) << "Cannot create data directory" << dataDir;
    }
    if (!m_config.backupPath.isEmpty() && m_config.autoBackup && !ensureDirectory(m_config.backupPath)) {
        qCWarning(lcKeeperStore) << "Cannot create backup directory" << m_config.backupPath;
    }
}

JsonTodoStore::~JsonTodoStore() = default;

const StoreConfig &JsonTodoStore::config() const
{
    return m_config;
}

void JsonTodoStore::save(const std::vector<TodoItem> &todos, const std::vector<Category> &categories)
{
    if (m_config.autoBackup) {
        createBackup();
    }

    Envelope envelope;
    envelope.todos = todos;
    envelope.categories = categories;
    envelope.version = QString::fromLatin1(CurrentEnvelopeVersion);
    envelope.lastModified = QDateTime::currentDateTimeUtc();

    const QJsonObject object = encodeEnvelope(envelope);
    QString error;
    if (!decodeEnvelope(object, nullptr, &error)) {
        qCCritical(lcKeeperStore) << "Refusing to save invalid data:" << error;
        throw DataError(ErrorCode::Save, QStringLiteral("Failed to save data: %1").arg(error),
                        { { QStringLiteral("path"), m_config.dataPath },
                          { QStringLiteral("cause"), error } });
    }
    reportDanglingReferences(envelope);

    const QByteArray payload = serializeEnvelope(envelope);
    if (!writeAtomically(m_config.dataPath, payload, &error)) {
        qCCritical(lcKeeperStore) << "Save failed:" << error;
        throw DataError(ErrorCode::Save, QStringLiteral("Failed to save data: %1").arg(error),
                        { { QStringLiteral("path"), m_config.dataPath },
                          { QStringLiteral("cause"), error } });
    }
    qCDebug(lcKeeperStore) << "Data saved to" << m_config.dataPath;
}

StoreData JsonTodoStore::load()
{
    const QFileInfo info(m_config.dataPath);
    if (!info.exists()) {
        qCInfo(lcKeeperStore) << "No existing data file at" << m_config.dataPath << "- starting empty";
        return {};
    }

    QByteArray payload;
    QString error;
    Envelope envelope;
    if (readFile(m_config.dataPath, &payload, &error)) {
        if (payload.trimmed().isEmpty()) {
            qCInfo(lcKeeperStore) << "Data file is empty - starting empty";
            return {};
        }
        if (parseEnvelope(payload, &envelope, &error)) {
            migrate(envelope);
            reportDanglingReferences(envelope);
            qCInfo(lcKeeperStore).nospace() << "Loaded " << envelope.todos.size() << " todos and "
                                            << envelope.categories.size() << " categories";
            return { std::move(envelope.todos), std::move(envelope.categories) };
        }
    }

    qCWarning(lcKeeperStore) << "Failed to load data:" << error;
    QVariantMap details{ { QStringLiteral("path"), m_config.dataPath },
                         { QStringLiteral("cause"), error } };
    if (!m_config.autoBackup) {
        throw DataError(ErrorCode::Load, QStringLiteral("Failed to load data: %1").arg(error), details);
    }

    qCInfo(lcKeeperStore) << "Attempting to load from backup";
    try {
        return loadFromBackup();
    } catch (const DataError &recoveryError) {
        details.insert(QStringLiteral("recovery"), recoveryError.codeName());
        details.insert(QStringLiteral("recoveryError"), recoveryError.message());
        throw DataError(ErrorCode::Load,
                        QStringLiteral("Failed to load data: %1 (recovery failed: %2)")
                            .arg(error, recoveryError.message()),
                        details);
    }
}

QString JsonTodoStore::backup()
{
    return createBackup();
}

StoreStats JsonTodoStore::stats() const
{
    StoreStats stats;
    const QFileInfo info(m_config.dataPath);
    if (info.exists() && info.isFile()) {
        stats.exists = true;
        stats.size = info.size();
        stats.lastModified = info.lastModified();
    }
    if (!m_config.backupPath.isEmpty() && QFileInfo(m_config.backupPath).isDir()) {
        stats.backupCount = backupFiles().size();
    }
    return stats;
}

void JsonTodoStore::exportTo(const QString &path)
{
    StoreData data;
    try {
        data = load();
    } catch (const DataError &error) {
        throw DataError::wrap(ErrorCode::Export, QStringLiteral("Failed to export data"), error,
                              { { QStringLiteral("path"), path } });
    }

    Envelope envelope;
    envelope.todos = std::move(data.todos);
    envelope.categories = std::move(data.categories);
    const QByteArray payload = QJsonDocument(encodeExport(envelope, QDateTime::currentDateTimeUtc()))
                                   .toJson(QJsonDocument::Indented);

    QString error;
    if (!writeAtomically(path, payload, &error)) {
        throw DataError(ErrorCode::Export, QStringLiteral("Failed to export data: %1").arg(error),
                        { { QStringLiteral("path"), path }, { QStringLiteral("cause"), error } });
    }
    qCInfo(lcKeeperStore) << "Data exported to" << path;
}

QStringList JsonTodoStore::backupFiles() const
{
    if (m_config.backupPath.isEmpty()) {
        return {};
    }
    const QDir dir(m_config.backupPath);
    QStringList names;
    const QStringList entries = dir.entryList(QDir::Files | QDir::NoDotAndDotDot, QDir::NoSort);
    for (const QString &entry : entries) {
        if (entry.startsWith(QLatin1String(BACKUP_PREFIX)) && entry.endsWith(QLatin1String(BACKUP_SUFFIX))) {
            names << entry;
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool JsonTodoStore::commitSaveFile(QSaveFile &file)
{
    return file.commit();
}

QString JsonTodoStore::createBackup()
{
    if (m_config.backupPath.isEmpty() || !QFileInfo::exists(m_config.dataPath)) {
        return {};
    }
    if (!ensureDirectory(m_config.backupPath)) {
        qCWarning(lcKeeperStore) << "Failed to create backup: cannot create" << m_config.backupPath;
        return {};
    }

    const QString stampedPrefix = QLatin1String(BACKUP_PREFIX)
        + QDateTime::currentDateTimeUtc().toString(QLatin1String(BACKUP_STAMP_FORMAT));
    int sequence = 0;
    for (const QString &existing : backupFiles()) {
        if (existing.startsWith(stampedPrefix)) {
            sequence = std::max(sequence, backupSequence(existing, stampedPrefix) + 1);
        }
    }
    if (sequence >= BACKUP_SEQUENCE_LIMIT) {
        qCWarning(lcKeeperStore) << "Failed to create backup: too many backups for" << stampedPrefix;
        return {};
    }

    const QString target = QDir(m_config.backupPath)
                               .filePath(QStringLiteral("%1-%2%3")
                                             .arg(stampedPrefix)
                                             .arg(sequence, 3, 10, QLatin1Char('0'))
                                             .arg(QLatin1String(BACKUP_SUFFIX)));
    if (!QFile::copy(m_config.dataPath, target)) {
        qCWarning(lcKeeperStore) << "Failed to create backup" << target;
        return {};
    }
    qCInfo(lcKeeperStore) << "Backup created:" << target;

    if (m_config.maxBackups > 0) {
        cleanupOldBackups();
    }
    return target;
}

void JsonTodoStore::cleanupOldBackups()
{
    QStringList backups = backupFiles();
    const QDir dir(m_config.backupPath);
    while (backups.size() > m_config.maxBackups) {
        const QString oldest = backups.takeFirst();
        if (QFile::remove(dir.filePath(oldest))) {
            qCDebug(lcKeeperStore) << "Removed old backup" << oldest;
        } else {
            qCWarning(lcKeeperStore) << "Failed to remove old backup" << oldest;
        }
    }
}

StoreData JsonTodoStore::loadFromBackup()
{
    if (m_config.backupPath.isEmpty()) {
        throw DataError(ErrorCode::NoBackupPath, QStringLiteral("No backup path configured"));
    }
    const QStringList backups = backupFiles();
    if (backups.isEmpty()) {
        throw DataError(ErrorCode::NoBackups, QStringLiteral("No backup files found"),
                        { { QStringLiteral("backupPath"), m_config.backupPath } });
    }

    const QString latest = QDir(m_config.backupPath).filePath(backups.last());
    qCInfo(lcKeeperStore) << "Loading from backup" << latest;

    QByteArray payload;
    QString error;
    Envelope envelope;
    if (!readFile(latest, &payload, &error) || !parseEnvelope(payload, &envelope, &error)) {
        throw DataError(ErrorCode::BackupLoad, QStringLiteral("Failed to load from backup: %1").arg(error),
                        { { QStringLiteral("backup"), latest }, { QStringLiteral("cause"), error } });
    }
    migrate(envelope);
    reportDanglingReferences(envelope);
    return { std::move(envelope.todos), std::move(envelope.categories) };
}

bool JsonTodoStore::writeAtomically(const QString &path, const QByteArray &payload, QString *error)
{
    const QString dir = QFileInfo(path).absolutePath();
    if (!ensureDirectory(dir)) {
        *error = QStringLiteral("Cannot create directory %1").arg(dir);
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        *error = QStringLiteral("Cannot open %1 for writing: %2").arg(path, file.errorString());
        return false;
    }
    if (file.write(payload) != payload.size()) {
        *error = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!commitSaveFile(file)) {
        *error = QStringLiteral("Cannot replace %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

void JsonTodoStore::migrate(Envelope &envelope) const
{
    if (envelope.version == QLatin1String(CurrentEnvelopeVersion)) {
        return;
    }
    qCWarning(lcKeeperStore) << "Unknown data version" << envelope.version << "- using as-is";
}

void JsonTodoStore::reportDanglingReferences(const Envelope &envelope) const
{
    for (const TodoItem &todo : danglingCategoryReferences(envelope)) {
        qCWarning(lcKeeperStore).nospace().noquote() << "Todo \"" << todo.title
                                           << "\" references non-existent category: " << todo.categoryId;
    }
}

} // namespace data
} // namespace keeper
