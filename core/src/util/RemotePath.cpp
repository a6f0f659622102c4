#include "openxfer/RemotePath.hpp"
#include "openxfer/SftpClient.hpp"

namespace openxfer {

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (name.empty())
        return base.empty() ? std::string("/") : base;
    if (!name.empty() && name.front() == '/')
        return joinRemotePath(base, name.substr(1));
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string remoteParentPath(const std::string &path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto pos = p.find_last_of('/');
    if (pos == std::string::npos)
        return {};
    if (pos == 0)
        return "/";
    return p.substr(0, pos);
}

std::string remoteBaseName(const std::string &path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

bool ensureRemoteDirectory(SftpClient &client, const std::string &remote_dir,
                           std::string &err) {
    if (remote_dir.empty() || remote_dir == "/")
        return true;
    bool isDir = false;
    std::string e;
    if (client.exists(remote_dir, isDir, e)) {
        if (!isDir) {
            err = "Remote path exists and is not a directory: " + remote_dir;
            return false;
        }
        return true;
    }
    if (!e.empty()) {
        err = e;
        return false;
    }
    if (!ensureRemoteDirectory(client, remoteParentPath(remote_dir), err))
        return false;
    if (!client.mkdir(remote_dir, e, 0755)) {
        // Another session may have created it in the meantime.
        std::string e2;
        if (client.exists(remote_dir, isDir, e2) && isDir)
            return true;
        err = e.empty() ? "mkdir failed: " + remote_dir : e;
        return false;
    }
    return true;
}

} // namespace openxfer
