#pragma once

#include <QString>

namespace keeper {
namespace data {

struct StoreConfig
{
    QString dataPath;
    QString backupPath;
    bool autoBackup = true;
    // 0 keeps every backup.
    int maxBackups = 5;

    // Data file and backups below QStandardPaths::AppDataLocation.
    static StoreConfig defaults();
    // backups/<file name> beside the data file, so distinct data files never share backups.
    static QString backupPathFor(const QString &dataPath);

    // Throws DataError(InvalidConfig).
    void validate() const;
};

} // namespace data
} // namespace keeper
