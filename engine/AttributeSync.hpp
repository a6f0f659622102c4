// Best-effort copy of permissions and modification time to the destination
// of a finished transfer. Failures are logged and reported as false only.
#pragma once
#include "EngineConfig.hpp"
#include "TransferTypes.hpp"
#include "openxfer/SftpClient.hpp"
#include <QFile>
#include <QString>

namespace openxfer {

// POSIX permission bits (0777) <-> QFile::Permissions.
unsigned int posixModeFromPermissions(QFile::Permissions p);
QFile::Permissions permissionsFromPosixMode(unsigned int mode);

// Blocking; call from an I/O worker holding the session.
bool preserveAttributes(SftpClient &client, Direction direction,
                        const QString &localPath, const QString &remotePath,
                        const AttributeConfig &config);

} // namespace openxfer
