#include "Logging.hpp"
#include "openxfer/RuntimeLogging.hpp"

Q_LOGGING_CATEGORY(oxPool, "openxfer.pool")
Q_LOGGING_CATEGORY(oxQueue, "openxfer.queue")
Q_LOGGING_CATEGORY(oxChunk, "openxfer.chunk")
Q_LOGGING_CATEGORY(oxSync, "openxfer.sync")
Q_LOGGING_CATEGORY(oxIntegrity, "openxfer.integrity")

namespace openxfer {

QString logValue(const QString &value) {
    return QString::fromStdString(redactedForLog(value.toStdString()));
}

} // namespace openxfer
