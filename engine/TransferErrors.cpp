#include "TransferErrors.hpp"

namespace openxfer {

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Connection:
        return "ConnectionError";
    case ErrorKind::PoolExhausted:
        return "PoolExhausted";
    case ErrorKind::TransferAborted:
        return "TransferAbortedError";
    case ErrorKind::Integrity:
        return "IntegrityError";
    case ErrorKind::RetryExhausted:
        return "RetryExhaustedError";
    case ErrorKind::Io:
        return "IoError";
    case ErrorKind::Configuration:
        return "ConfigurationError";
    }
    return "unknown";
}

} // namespace openxfer
