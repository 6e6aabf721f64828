#pragma once

#include "keeper/data/StoreConfig.hpp"
#include "keeper/data/TodoStore.hpp"

#include <QByteArray>
#include <QStringList>

class QSaveFile;

namespace keeper {
namespace data {

struct Envelope;

/*
 * Keeps the record sets in a single JSON file.
 *
 * Writes go to a temporary file that is renamed over the target, so the data
 * file always holds either the previous or the new content. Before each write
 * the current file is copied into the backup directory (when enabled) and the
 * oldest copies beyond StoreConfig::maxBackups are removed. A file that cannot
 * be read or fails structural validation is replaced by the newest backup.
 */
class JsonTodoStore : public TodoStore
{
public:
    explicit JsonTodoStore(StoreConfig config);
    ~JsonTodoStore() override;

    void save(const std::vector<TodoItem> &todos, const std::vector<Category> &categories) override;
    StoreData load() override;
    QString backup() override;
    StoreStats stats() const override;
    void exportTo(const QString &path) override;

    const StoreConfig &config() const;
    // Backup file names, oldest first.
    QStringList backupFiles() const;

protected:
    // Final rename step of an atomic write.
    virtual bool commitSaveFile(QSaveFile &file);

private:
    QString createBackup();
    void cleanupOldBackups();
    StoreData loadFromBackup();
    bool writeAtomically(const QString &path, const QByteArray &payload, QString *error);
    void migrate(Envelope &envelope) const;
    void reportDanglingReferences(const Envelope &envelope) const;

    StoreConfig m_config;
};

} // namespace data
} // namespace keeper
