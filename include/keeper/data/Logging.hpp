#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcKeeperStore)
Q_DECLARE_LOGGING_CATEGORY(lcKeeperManager)
