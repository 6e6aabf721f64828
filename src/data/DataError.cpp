#include "keeper/data/DataError.hpp"

namespace keeper {
namespace data {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Validation:
        return QStringLiteral("VALIDATION_ERROR");
    case ErrorCode::TodoNotFound:
        return QStringLiteral("TODO_NOT_FOUND");
    case ErrorCode::CategoryNotFound:
        return QStringLiteral("CATEGORY_NOT_FOUND");
    case ErrorCode::DuplicateName:
        return QStringLiteral("DUPLICATE_CATEGORY_NAME");
    case ErrorCode::NotInitialized:
        return QStringLiteral("NOT_INITIALIZED");
    case ErrorCode::Save:
        return QStringLiteral("SAVE_ERROR");
    case ErrorCode::Load:
        return QStringLiteral("LOAD_ERROR");
    case ErrorCode::Export:
        return QStringLiteral("EXPORT_ERROR");
    case ErrorCode::BackupLoad:
        return QStringLiteral("BACKUP_LOAD_ERROR");
    case ErrorCode::NoBackupPath:
        return QStringLiteral("NO_BACKUP_PATH");
    case ErrorCode::NoBackups:
        return QStringLiteral("NO_BACKUPS");
    case ErrorCode::InvalidConfig:
        return QStringLiteral("INVALID_CONFIG");
    }
    return QStringLiteral("UNKNOWN_ERROR");
}

DataError::DataError(ErrorCode code, const QString &message, QVariantMap details)
    : std::runtime_error(message.toStdString())
    , m_code(code)
    , m_message(message)
    , m_details(std::move(details))
{
}

DataError DataError::wrap(ErrorCode code, const QString &context, const std::exception &cause,
                          QVariantMap details)
{
    const QString causeMessage = QString::fromUtf8(cause.what());
    details.insert(QStringLiteral("cause"), causeMessage);
    if (const auto *inner = dynamic_cast<const DataError *>(&cause)) {
        details.insert(QStringLiteral("causeCode"), inner->codeName());
    }
    return DataError(code, QStringLiteral("%1: %2").arg(context, causeMessage), std::move(details));
}

} // namespace data
} // namespace keeper
