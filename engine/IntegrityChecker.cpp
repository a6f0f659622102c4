#include "IntegrityChecker.hpp"
#include "Logging.hpp"

#include <QCryptographicHash>
#include <QFile>

namespace openxfer {

namespace {
constexpr qint64 kReadBlock = 256 * 1024;

QCryptographicHash::Algorithm qtAlgorithm(ChecksumAlgorithm a) {
    return a == ChecksumAlgorithm::Md5 ? QCryptographicHash::Md5
                                       : QCryptographicHash::Sha256;
}
} // namespace

bool localFileDigest(const QString &path, ChecksumAlgorithm algorithm,
                     QString &hexOut, QString &err) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        err = QStringLiteral("Cannot open local file: %1").arg(f.errorString());
        return false;
    }
    QCryptographicHash hash(qtAlgorithm(algorithm));
    while (!f.atEnd()) {
        const QByteArray block = f.read(kReadBlock);
        if (block.isEmpty() && f.error() != QFileDevice::NoError) {
            err = QStringLiteral("Read error: %1").arg(f.errorString());
            return false;
        }
        hash.addData(block);
    }
    hexOut = QString::fromLatin1(hash.result().toHex());
    return true;
}

IntegrityResult verifyTransferIntegrity(SftpClient &client,
                                        const QString &localPath,
                                        const QString &remotePath,
                                        quint64 size,
                                        const IntegrityConfig &config) {
    IntegrityResult r;
    if (!config.enabled || size < config.thresholdBytes)
        return r;

    std::string hex, rerr;
    if (!client.checksum(remotePath.toStdString(), config.algorithm, hex,
                         rerr)) {
        if (!client.isConnected()) {
            r.outcome = IntegrityOutcome::Error;
            r.message = QString::fromStdString(rerr);
            return r;
        }
        qCWarning(oxIntegrity)
            << "Remote checksum unavailable for" << logValue(remotePath)
            << "- skipping verification:" << QString::fromStdString(rerr);
        r.message = QString::fromStdString(rerr);
        return r;
    }
    r.remoteDigest = QString::fromStdString(hex).toLower();

    QString lerr;
    if (!localFileDigest(localPath, config.algorithm, r.localDigest, lerr)) {
        r.outcome = IntegrityOutcome::Error;
        r.message = lerr;
        return r;
    }

    if (r.localDigest != r.remoteDigest) {
        r.outcome = IntegrityOutcome::Mismatch;
        r.message = QStringLiteral("%1 mismatch (local %2, remote %3)")
                        .arg(QString::fromLatin1(
                                 checksumAlgorithmName(config.algorithm)),
                             r.localDigest, r.remoteDigest);
        qCWarning(oxIntegrity) << "Checksum mismatch for" << logValue(localPath)
                               << "local" << r.localDigest << "remote"
                               << r.remoteDigest;
        return r;
    }
    r.outcome = IntegrityOutcome::Verified;
    qCDebug(oxIntegrity) << "Verified" << logValue(remotePath);
    return r;
}

} // namespace openxfer
