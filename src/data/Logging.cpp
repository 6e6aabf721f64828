#include "keeper/data/Logging.hpp"

Q_LOGGING_CATEGORY(lcKeeperStore, "keeper.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcKeeperManager, "keeper.manager", QtInfoMsg)
