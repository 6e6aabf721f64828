#pragma once

#include <QString>
#include <QVariantMap>
#include <stdexcept>

namespace keeper {
namespace data {

enum class ErrorCode
{
    Validation,
    TodoNotFound,
    CategoryNotFound,
    DuplicateName,
    NotInitialized,
    Save,
    Load,
    Export,
    BackupLoad,
    NoBackupPath,
    NoBackups,
    InvalidConfig,
};

// Stable machine-readable name, e.g. "SAVE_ERROR".
QString errorCodeName(ErrorCode code);

class DataError : public std::runtime_error
{
public:
    DataError(ErrorCode code, const QString &message, QVariantMap details = {});

    ErrorCode code() const { return m_code; }
    QString codeName() const { return errorCodeName(m_code); }
    QString message() const { return m_message; }
    const QVariantMap &details() const { return m_details; }

    // Wraps an underlying failure; its message lands in details()["cause"].
    static DataError wrap(ErrorCode code, const QString &context, const std::exception &cause,
                          QVariantMap details = {});

private:
    ErrorCode m_code;
    QString m_message;
    QVariantMap m_details;
};

} // namespace data
} // namespace keeper
