// Logging categories of the transfer engine. Filter with QT_LOGGING_RULES,
// e.g. "openxfer.pool.debug=true".
#pragma once
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(oxPool)
Q_DECLARE_LOGGING_CATEGORY(oxQueue)
Q_DECLARE_LOGGING_CATEGORY(oxChunk)
Q_DECLARE_LOGGING_CATEGORY(oxSync)
Q_DECLARE_LOGGING_CATEGORY(oxIntegrity)

namespace openxfer {

// Path or user name as it may appear in logs (redacted unless sensitive
// logging is enabled for a dev environment).
QString logValue(const QString &value);

} // namespace openxfer
