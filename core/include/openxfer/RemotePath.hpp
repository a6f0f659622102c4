// Helpers for POSIX-style remote paths.
#pragma once
#include <string>

namespace openxfer {

class SftpClient;

std::string joinRemotePath(const std::string &base, const std::string &name);

// "/a/b/c.txt" -> "/a/b"; "/c.txt" -> "/"; "c.txt" -> "".
std::string remoteParentPath(const std::string &path);

std::string remoteBaseName(const std::string &path);

// Creates every missing component of remote_dir (like mkdir -p).
bool ensureRemoteDirectory(SftpClient &client, const std::string &remote_dir,
                           std::string &err);

} // namespace openxfer
