#pragma once

#include "keeper/data/StoreConfig.hpp"

class QSettings;

namespace keeper {
namespace core {

struct ManagerConfig
{
    data::StoreConfig store;
    bool autoSave = true;
    bool createDefaultCategories = true;

    static ManagerConfig defaults();
    // Reads the storage/* keys, falling back to defaults() for missing ones. A non-empty
    // dataPath replaces storage/dataPath. Without storage/backupPath the backups go to
    // StoreConfig::backupPathFor() of the resulting data file.
    static ManagerConfig fromSettings(const QSettings &settings, const QString &dataPath = QString());
};

} // namespace core
} // namespace keeper
