#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <string>
#include <vector>

// libssh2 internal types (underscore names) so callers need not include it.
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace openxfer {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }
    void interrupt() override;

    bool list(const std::string &remote_path, std::vector<FileInfo> &out,
              std::string &err) override;
    bool get(const std::string &remote, const std::string &local,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}, bool resume = false) override;
    bool put(const std::string &local, const std::string &remote,
             std::string &err, ProgressCB progress = {},
             CancelCB shouldCancel = {}, bool resume = false) override;
    bool getRange(const std::string &remote, const std::string &local,
                  std::uint64_t offset, std::uint64_t length, std::string &err,
                  ProgressCB progress = {}, CancelCB shouldCancel = {}) override;
    bool putRange(const std::string &local, const std::string &remote,
                  std::uint64_t offset, std::uint64_t length, std::string &err,
                  ProgressCB progress = {}, CancelCB shouldCancel = {}) override;
    bool allocate(const std::string &remote, std::uint64_t size,
                  std::string &err) override;
    bool exists(const std::string &remote_path, bool &isDir,
                std::string &err) override;
    bool stat(const std::string &remote_path, FileInfo &info,
              std::string &err) override;
    bool chmod(const std::string &remote_path, std::uint32_t mode,
               std::string &err) override;
    bool setTimes(const std::string &remote_path, std::uint64_t atime,
                  std::uint64_t mtime, std::string &err) override;
    bool mkdir(const std::string &remote_dir, std::string &err,
               unsigned int mode = 0755) override;
    bool removeFile(const std::string &remote_path, std::string &err) override;
    bool removeDir(const std::string &remote_dir, std::string &err) override;
    bool rename(const std::string &from, const std::string &to,
                std::string &err, bool overwrite = false) override;
    bool checksum(const std::string &remote_path, ChecksumAlgorithm algorithm,
                  std::string &hexOut, std::string &err) override;
    std::unique_ptr<SftpClient> newConnectionLike(const SessionOptions &opt,
                                                  std::string &err) override;

private:
    std::atomic<bool> connected_{false};
    std::atomic<int> sock_{-1};
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool tcpConnect(const std::string &host, uint16_t port, std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticate(const SessionOptions &opt, std::string &err);
    bool agentAuth(const std::string &user);
    bool ready(std::string &err) const;
    // Appends the libssh2 error text to err and flags the session as
    // disconnected when the transport itself failed.
    void noteFailure(std::string &err);
};

} // namespace openxfer
