// Post-transfer checksum comparison between a local file and its remote
// counterpart.
#pragma once
#include "EngineConfig.hpp"
#include "openxfer/SftpClient.hpp"
#include <QString>

namespace openxfer {

enum class IntegrityOutcome { Verified, Skipped, Mismatch, Error };

struct IntegrityResult {
    IntegrityOutcome outcome = IntegrityOutcome::Skipped;
    QString localDigest;
    QString remoteDigest;
    QString message;
};

// Lowercase hex digest of a local file, read in blocks.
bool localFileDigest(const QString &path, ChecksumAlgorithm algorithm,
                     QString &hexOut, QString &err);

// Skipped when disabled, below the size threshold, or when the remote side
// cannot compute checksums. Blocking; call from an I/O worker.
IntegrityResult verifyTransferIntegrity(SftpClient &client,
                                        const QString &localPath,
                                        const QString &remotePath,
                                        quint64 size,
                                        const IntegrityConfig &config);

} // namespace openxfer
