#include "keeper/core/ManagerConfig.hpp"

#include <QSettings>

namespace keeper {
namespace core {

ManagerConfig ManagerConfig::defaults()
{
    ManagerConfig config;
    config.store = data::StoreConfig::defaults();
    return config;
}

ManagerConfig ManagerConfig::fromSettings(const QSettings &settings, const QString &dataPath)
{
    ManagerConfig config = defaults();
    config.store.dataPath = dataPath.isEmpty()
        ? settings.value(QStringLiteral("storage/dataPath"), config.store.dataPath).toString()
        : dataPath;
    config.store.backupPath = settings.value(QStringLiteral("storage/backupPath"),
                                             data::StoreConfig::backupPathFor(config.store.dataPath))
                                  .toString();
    config.store.autoBackup = settings.value(QStringLiteral("storage/autoBackup"), config.store.autoBackup).toBool();
    config.store.maxBackups = settings.value(QStringLiteral("storage/maxBackups"), config.store.maxBackups).toInt();
    config.autoSave = settings.value(QStringLiteral("storage/autoSave"), config.autoSave).toBool();
    config.createDefaultCategories =
        settings.value(QStringLiteral("storage/createDefaultCategories"), config.createDefaultCategories).toBool();
    config.store.validate();
    return config;
}

} // namespace core
} // namespace keeper
