// In-memory backend. Every client created from the same MockRemoteFs (through
// newConnectionLike) sees the same files, which lets tests exercise pooled
// and parallel transfers without a server.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>

namespace openxfer {

class MockRemoteFs {
public:
    struct Node {
        bool is_dir = false;
        std::string data;
        std::uint64_t mtime = 0;
        std::uint32_t mode = 0;
    };
    using DigestFn = std::function<std::string(const std::string &data,
                                               ChecksumAlgorithm algorithm)>;

    // Seeds a small tree: /home/{alice,guest}, /home/notes.md, /var/log,
    // /readme.txt.
    MockRemoteFs();

    void writeFile(const std::string &path, const std::string &data,
                   std::uint64_t mtime = 0, std::uint32_t mode = 0100644);
    bool readFile(const std::string &path, std::string &out) const;
    bool contains(const std::string &path) const;
    void makeDir(const std::string &path);

    // Next `count` transfer calls fail with `message`. With dropConnection
    // the failing client also reports itself disconnected.
    void failNextTransfers(int count, const std::string &message,
                           bool dropConnection = false);
    void setConnectFailure(const std::string &message);
    void clearConnectFailure();
    void setConnectDelayMs(int ms) { connectDelayMs_ = ms; }
    void setBlockDelayMs(int ms) { blockDelayMs_ = ms; }
    void setBlockSize(std::size_t bytes);
    void setDigestFunction(DigestFn fn);

    int connectCount() const { return connectCount_.load(); }
    int liveConnections() const { return live_.load(); }
    int peakLiveConnections() const { return peakLive_.load(); }

private:
    friend class MockSftpClient;

    bool takeInjectedFailure(std::string &message, bool &drop);
    bool nodeFor(const std::string &path, Node &out) const;
    void onConnect();
    void onDisconnect();

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    int pendingFailures_ = 0;
    std::string failureMessage_;
    bool failureDrops_ = false;
    std::string connectFailure_;
    DigestFn digest_;
    std::size_t blockSize_ = 64 * 1024;
    std::atomic<int> connectDelayMs_{0};
    std::atomic<int> blockDelayMs_{0};
    std::atomic<int> connectCount_{0};
    std::atomic<int> live_{0};
    std::atomic<int> peakLive_{0};
};

class MockSftpClient : public SftpClient {
public:
    MockSftpClient();
    explicit MockSftpClient(std::shared_ptr<MockRemoteFs> fs);
    ~MockSftpClient() override;

    const std::shared_ptr<MockRemoteFs> &remoteFs() const { return fs_; }

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
    bool ready(std::string &err) const;
    // Injected failure or interrupt for a transfer step.
    bool transferFault(std::string &err);
    bool canceled(const CancelCB &shouldCancel, std::string &err) const;
    void blockPause() const;

    std::shared_ptr<MockRemoteFs> fs_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> interrupted_{false};
};

} // namespace openxfer
