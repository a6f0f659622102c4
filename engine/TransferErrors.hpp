// Failure classification carried alongside the human-readable message.
#pragma once
#include <QString>

namespace openxfer {

enum class ErrorKind {
    None,
    Connection,      // session establishment or authentication failed
    PoolExhausted,   // no session available within the wait budget
    TransferAborted, // cooperative cancellation observed
    Integrity,       // post-transfer checksum mismatch
    RetryExhausted,  // failed and no retries remain
    Io,              // local or remote read/write failure
    Configuration    // unknown host, missing credentials, bad pattern
};

struct TransferError {
    ErrorKind kind = ErrorKind::None;
    QString message;

    bool ok() const { return kind == ErrorKind::None; }

    static TransferError make(ErrorKind kind, const QString &message) {
        TransferError e;
        e.kind = kind;
        e.message = message;
        return e;
    }
};

const char *errorKindName(ErrorKind kind);

} // namespace openxfer
