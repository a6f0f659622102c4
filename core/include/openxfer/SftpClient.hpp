// Abstract remote-session capability. The transfer engine only orchestrates
// calls to this interface; concrete backends (libssh2, mock) implement it.
// A client instance is used by one thread at a time.
#pragma once
#include "SftpTypes.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace openxfer {

class SftpClient {
public:
    using ProgressCB =
        std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    virtual bool connect(const SessionOptions &opt, std::string &err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Unblocks pending I/O from another thread. The session must be
    // discarded afterwards.
    virtual void interrupt() {}

    virtual bool list(const std::string &remote_path,
                      std::vector<FileInfo> &out, std::string &err) = 0;

    // Download remote to local. With resume=true continue from the current
    // local size. progress reports absolute bytes of the whole file.
    virtual bool get(const std::string &remote, const std::string &local,
                     std::string &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}, bool resume = false) = 0;

    // Upload local to remote. With resume=true continue from the current
    // remote size.
    virtual bool put(const std::string &local, const std::string &remote,
                     std::string &err, ProgressCB progress = {},
                     CancelCB shouldCancel = {}, bool resume = false) = 0;

    // Copy bytes [offset, offset + length) of remote into the same range of
    // an existing local file. progress reports bytes done within the range.
    virtual bool getRange(const std::string &remote, const std::string &local,
                          std::uint64_t offset, std::uint64_t length,
                          std::string &err, ProgressCB progress = {},
                          CancelCB shouldCancel = {}) = 0;

    // Copy bytes [offset, offset + length) of local into the same range of
    // an existing remote file.
    virtual bool putRange(const std::string &local, const std::string &remote,
                          std::uint64_t offset, std::uint64_t length,
                          std::string &err, ProgressCB progress = {},
                          CancelCB shouldCancel = {}) = 0;

    // Create or truncate remote and set its size to `size` bytes.
    virtual bool allocate(const std::string &remote, std::uint64_t size,
                          std::string &err) = 0;

    // Leaves err empty when the path simply does not exist.
    virtual bool exists(const std::string &remote_path, bool &isDir,
                        std::string &err) = 0;

    // Returns false (err empty) when the path does not exist.
    virtual bool stat(const std::string &remote_path, FileInfo &info,
                      std::string &err) = 0;

    virtual bool chmod(const std::string &remote_path, std::uint32_t mode,
                       std::string &err) = 0;

    virtual bool setTimes(const std::string &remote_path, std::uint64_t atime,
                          std::uint64_t mtime, std::string &err) = 0;

    virtual bool mkdir(const std::string &remote_dir, std::string &err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string &remote_path,
                            std::string &err) = 0;

    virtual bool removeDir(const std::string &remote_dir,
                           std::string &err) = 0;

    virtual bool rename(const std::string &from, const std::string &to,
                        std::string &err, bool overwrite = false) = 0;

    // Lowercase hex digest of the remote file content.
    virtual bool checksum(const std::string &remote_path,
                          ChecksumAlgorithm algorithm, std::string &hexOut,
                          std::string &err) = 0;

    // New connected client of the same backend with the given options.
    virtual std::unique_ptr<SftpClient>
    newConnectionLike(const SessionOptions &opt, std::string &err) = 0;
};

} // namespace openxfer
