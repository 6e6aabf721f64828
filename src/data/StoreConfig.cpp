#include "keeper/data/StoreConfig.hpp"

#include "keeper/data/DataError.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace keeper {
namespace data {

StoreConfig StoreConfig::defaults()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/todo-keeper");
    }
    const QDir dir(storageFolder);

    StoreConfig config;
    config.dataPath = dir.filePath(QStringLiteral("todos.json"));
    config.backupPath = backupPathFor(config.dataPath);
    return config;
}

QString StoreConfig::backupPathFor(const QString &dataPath)
{
    const QFileInfo info(dataPath);
    return info.absoluteDir().filePath(QStringLiteral("backups/") + info.fileName());
}

void StoreConfig::validate() const
{
    if (dataPath.trimmed().isEmpty()) {
        throw DataError(ErrorCode::InvalidConfig, QStringLiteral("Data file path must not be empty"));
    }
    if (maxBackups < 0) {
        throw DataError(ErrorCode::InvalidConfig,
                        QStringLiteral("Maximum backup count must not be negative"),
                        { { QStringLiteral("maxBackups"), maxBackups } });
    }
    if (!backupPath.isEmpty()
        && QFileInfo(backupPath).absoluteFilePath() == QFileInfo(dataPath).absoluteFilePath()) {
        throw DataError(ErrorCode::InvalidConfig,
                        QStringLiteral("Backup directory must differ from the data file"),
                        { { QStringLiteral("backupPath"), backupPath } });
    }
}

} // namespace data
} // namespace keeper
