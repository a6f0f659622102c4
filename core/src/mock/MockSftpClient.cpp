#include "openxfer/MockSftpClient.hpp"
#include "openxfer/RemotePath.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>

namespace openxfer {

namespace {

constexpr std::uint32_t kDirMode = 040755;

std::string normalize(const std::string &path) {
    if (path.empty())
        return "/";
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    return p;
}

std::uint64_t nowSeconds() {
    return static_cast<std::uint64_t>(std::time(nullptr));
}

bool readLocal(const std::string &local, std::string &out) {
    std::ifstream in(local, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return !in.bad();
}

} // namespace

// ---- MockRemoteFs ---------------------------------------------------------

MockRemoteFs::MockRemoteFs() {
    makeDir("/");
    makeDir("/home");
    makeDir("/home/alice");
    makeDir("/home/guest");
    makeDir("/var");
    makeDir("/var/log");
    writeFile("/readme.txt", std::string(1280, 'r'));
    writeFile("/home/notes.md", std::string(2048, 'n'));
    writeFile("/home/alice/photo.jpg", std::string(34567, 'p'));
}

void MockRemoteFs::writeFile(const std::string &path, const std::string &data,
                             std::uint64_t mtime, std::uint32_t mode) {
    std::lock_guard<std::mutex> lk(mtx_);
    Node &n = nodes_[normalize(path)];
    n.is_dir = false;
    n.data = data;
    n.mtime = mtime ? mtime : nowSeconds();
    n.mode = mode;
}

bool MockRemoteFs::readFile(const std::string &path, std::string &out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.is_dir)
        return false;
    out = it->second.data;
    return true;
}

bool MockRemoteFs::contains(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return nodes_.count(normalize(path)) > 0;
}

void MockRemoteFs::makeDir(const std::string &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    Node &n = nodes_[normalize(path)];
    n.is_dir = true;
    n.data.clear();
    n.mode = kDirMode;
    n.mtime = nowSeconds();
}

void MockRemoteFs::failNextTransfers(int count, const std::string &message,
                                     bool dropConnection) {
    std::lock_guard<std::mutex> lk(mtx_);
    pendingFailures_ = count;
    failureMessage_ = message;
    failureDrops_ = dropConnection;
}

void MockRemoteFs::setConnectFailure(const std::string &message) {
    std::lock_guard<std::mutex> lk(mtx_);
    connectFailure_ = message;
}

void MockRemoteFs::clearConnectFailure() {
    std::lock_guard<std::mutex> lk(mtx_);
    connectFailure_.clear();
}

void MockRemoteFs::setBlockSize(std::size_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    blockSize_ = std::max<std::size_t>(1, bytes);
}

void MockRemoteFs::setDigestFunction(DigestFn fn) {
    std::lock_guard<std::mutex> lk(mtx_);
    digest_ = std::move(fn);
}

bool MockRemoteFs::takeInjectedFailure(std::string &message, bool &drop) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (pendingFailures_ <= 0)
        return false;
    --pendingFailures_;
    message = failureMessage_;
    drop = failureDrops_;
    return true;
}

bool MockRemoteFs::nodeFor(const std::string &path, Node &out) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end())
        return false;
    out = it->second;
    return true;
}

void MockRemoteFs::onConnect() {
    ++connectCount_;
    const int now = ++live_;
    int peak = peakLive_.load();
    while (now > peak && !peakLive_.compare_exchange_weak(peak, now)) {
    }
}

void MockRemoteFs::onDisconnect() { --live_; }

// ---- MockSftpClient -------------------------------------------------------

MockSftpClient::MockSftpClient() : fs_(std::make_shared<MockRemoteFs>()) {}

MockSftpClient::MockSftpClient(std::shared_ptr<MockRemoteFs> fs)
    : fs_(std::move(fs)) {}

MockSftpClient::~MockSftpClient() { disconnect(); }

bool MockSftpClient::connect(const SessionOptions &opt, std::string &err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    if (connected_) {
        err = "Already connected";
        return false;
    }
    const int delay = fs_->connectDelayMs_.load();
    if (delay > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        if (!fs_->connectFailure_.empty()) {
            err = fs_->connectFailure_;
            return false;
        }
    }
    fs_->onConnect();
    interrupted_ = false;
    connected_ = true;
    return true;
}

void MockSftpClient::disconnect() {
    if (connected_.exchange(false))
        fs_->onDisconnect();
}

bool MockSftpClient::ready(std::string &err) const {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    return true;
}

bool MockSftpClient::transferFault(std::string &err) {
    if (interrupted_) {
        err = "Interrupted";
        disconnect();
        return true;
    }
    bool drop = false;
    std::string msg;
    if (!fs_->takeInjectedFailure(msg, drop))
        return false;
    err = msg;
    if (drop)
        disconnect();
    return true;
}

bool MockSftpClient::canceled(const CancelCB &shouldCancel,
                              std::string &err) const {
    if (shouldCancel && shouldCancel()) {
        err = "Canceled by user";
        return true;
    }
    return false;
}

void MockSftpClient::interrupt() {
    interrupted_ = true;
    disconnect();
}

// Sleeps in short steps so an interrupt cuts a long delay short.
void MockSftpClient::blockPause() const {
    const auto until = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(fs_->blockDelayMs_.load());
    while (!interrupted_ && std::chrono::steady_clock::now() < until) {
        const auto left = until - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(
                left, std::chrono::milliseconds(5)));
    }
}

bool MockSftpClient::list(const std::string &remote_path,
                          std::vector<FileInfo> &out, std::string &err) {
    if (!ready(err))
        return false;
    const std::string dir = normalize(remote_path);
    out.clear();
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto self = fs_->nodes_.find(dir);
        if (self == fs_->nodes_.end() || !self->second.is_dir) {
            err = "Remote path not found: " + dir;
            return false;
        }
        for (const auto &kv : fs_->nodes_) {
            if (kv.first == dir || remoteParentPath(kv.first) != dir)
                continue;
            FileInfo fi;
            fi.name = remoteBaseName(kv.first);
            fi.is_dir = kv.second.is_dir;
            fi.has_size = !kv.second.is_dir;
            fi.size = kv.second.is_dir ? 0 : kv.second.data.size();
            fi.mtime = kv.second.mtime;
            fi.mode = kv.second.mode;
            out.push_back(std::move(fi));
        }
    }
    std::sort(out.begin(), out.end(), [](const FileInfo &a, const FileInfo &b) {
        if (a.is_dir != b.is_dir)
            return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::get(const std::string &remote, const std::string &local,
                         std::string &err, ProgressCB progress,
                         CancelCB shouldCancel, bool resume) {
    if (!ready(err))
        return false;
    MockRemoteFs::Node node;
    if (!fs_->nodeFor(remote, node) || node.is_dir) {
        err = "Remote file not found: " + remote;
        return false;
    }
    std::uint64_t offset = 0;
    if (resume) {
        std::ifstream existing(local, std::ios::binary | std::ios::ate);
        if (existing.is_open())
            offset = static_cast<std::uint64_t>(existing.tellg());
        if (offset > node.data.size())
            offset = 0;
    }
    std::ofstream out(local, std::ios::binary |
                                 (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!out.is_open()) {
        err = "Could not open local file for writing";
        return false;
    }
    std::size_t block = 0;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        block = fs_->blockSize_;
    }
    const std::uint64_t total = node.data.size();
    std::uint64_t done = offset;
    while (done < total) {
        if (canceled(shouldCancel, err) || transferFault(err))
            return false;
        const std::size_t n =
            static_cast<std::size_t>(std::min<std::uint64_t>(block, total - done));
        out.write(node.data.data() + done, static_cast<std::streamsize>(n));
        if (!out) {
            err = "Local write failed";
            return false;
        }
        done += n;
        if (progress)
            progress(done, total);
        blockPause();
    }
    if (total == 0 && transferFault(err))
        return false;
    return true;
}

bool MockSftpClient::put(const std::string &local, const std::string &remote,
                         std::string &err, ProgressCB progress,
                         CancelCB shouldCancel, bool resume) {
    if (!ready(err))
        return false;
    std::string data;
    if (!readLocal(local, data)) {
        err = "Could not open local file for reading";
        return false;
    }
    const std::string path = normalize(remote);
    std::uint64_t offset = 0;
    std::size_t block = 0;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        auto parent = fs_->nodes_.find(remoteParentPath(path));
        if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
            err = "Remote parent directory does not exist: " + path;
            return false;
        }
        MockRemoteFs::Node &n = fs_->nodes_[path];
        if (n.is_dir) {
            err = "Remote path is a directory: " + path;
            return false;
        }
        if (resume && n.data.size() <= data.size())
            offset = n.data.size();
        n.data.resize(static_cast<std::size_t>(offset));
        n.mtime = nowSeconds();
        if (n.mode == 0)
            n.mode = 0100644;
        block = fs_->blockSize_;
    }
    const std::uint64_t total = data.size();
    std::uint64_t done = offset;
    while (done < total) {
        if (canceled(shouldCancel, err) || transferFault(err))
            return false;
        const std::size_t n =
            static_cast<std::size_t>(std::min<std::uint64_t>(block, total - done));
        {
            std::lock_guard<std::mutex> lk(fs_->mtx_);
            fs_->nodes_[path].data.append(data, static_cast<std::size_t>(done), n);
        }
        done += n;
        if (progress)
            progress(done, total);
        blockPause();
    }
    if (total == 0 && transferFault(err))
        return false;
    return true;
}

bool MockSftpClient::getRange(const std::string &remote,
                              const std::string &local, std::uint64_t offset,
                              std::uint64_t length, std::string &err,
                              ProgressCB progress, CancelCB shouldCancel) {
    if (!ready(err))
        return false;
    MockRemoteFs::Node node;
    if (!fs_->nodeFor(remote, node) || node.is_dir) {
        err = "Remote file not found: " + remote;
        return false;
    }
    if (offset + length > node.data.size()) {
        err = "Requested range exceeds remote file size";
        return false;
    }
    std::fstream out(local, std::ios::binary | std::ios::in | std::ios::out);
    if (!out.is_open()) {
        err = "Could not open local file for ranged write";
        return false;
    }
    std::size_t block = 0;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        block = fs_->blockSize_;
    }
    std::uint64_t done = 0;
    while (done < length) {
        if (canceled(shouldCancel, err) || transferFault(err))
            return false;
        const std::size_t n =
            static_cast<std::size_t>(std::min<std::uint64_t>(block, length - done));
        out.seekp(static_cast<std::streamoff>(offset + done));
        out.write(node.data.data() + offset + done,
                  static_cast<std::streamsize>(n));
        if (!out) {
            err = "Local write failed";
            return false;
        }
        done += n;
        if (progress)
            progress(done, length);
        blockPause();
    }
    return true;
}

bool MockSftpClient::putRange(const std::string &local,
                              const std::string &remote, std::uint64_t offset,
                              std::uint64_t length, std::string &err,
                              ProgressCB progress, CancelCB shouldCancel) {
    if (!ready(err))
        return false;
    std::ifstream in(local, std::ios::binary);
    if (!in.is_open()) {
        err = "Could not open local file for reading";
        return false;
    }
    const std::string path = normalize(remote);
    if (!fs_->contains(path)) {
        err = "Remote file not allocated: " + path;
        return false;
    }
    std::size_t block = 0;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        block = fs_->blockSize_;
    }
    std::vector<char> buf(block);
    std::uint64_t done = 0;
    while (done < length) {
        if (canceled(shouldCancel, err) || transferFault(err))
            return false;
        const std::size_t n =
            static_cast<std::size_t>(std::min<std::uint64_t>(block, length - done));
        in.seekg(static_cast<std::streamoff>(offset + done));
        in.read(buf.data(), static_cast<std::streamsize>(n));
        if (static_cast<std::size_t>(in.gcount()) != n) {
            err = "Local read failed";
            return false;
        }
        {
            std::lock_guard<std::mutex> lk(fs_->mtx_);
            std::string &data = fs_->nodes_[path].data;
            const std::size_t at = static_cast<std::size_t>(offset + done);
            if (data.size() < at + n)
                data.resize(at + n);
            data.replace(at, n, buf.data(), n);
        }
        done += n;
        if (progress)
            progress(done, length);
        blockPause();
    }
    return true;
}

bool MockSftpClient::allocate(const std::string &remote, std::uint64_t size,
                              std::string &err) {
    if (!ready(err))
        return false;
    const std::string path = normalize(remote);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto parent = fs_->nodes_.find(remoteParentPath(path));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = "Remote parent directory does not exist: " + path;
        return false;
    }
    MockRemoteFs::Node &n = fs_->nodes_[path];
    if (n.is_dir) {
        err = "Remote path is a directory: " + path;
        return false;
    }
    n.data.assign(static_cast<std::size_t>(size), '\0');
    n.mtime = nowSeconds();
    if (n.mode == 0)
        n.mode = 0100644;
    return true;
}

bool MockSftpClient::exists(const std::string &remote_path, bool &isDir,
                            std::string &err) {
    isDir = false;
    if (!ready(err))
        return false;
    MockRemoteFs::Node node;
    if (!fs_->nodeFor(remote_path, node)) {
        err.clear();
        return false;
    }
    isDir = node.is_dir;
    return true;
}

bool MockSftpClient::stat(const std::string &remote_path, FileInfo &info,
                          std::string &err) {
    if (!ready(err))
        return false;
    MockRemoteFs::Node node;
    if (!fs_->nodeFor(remote_path, node)) {
        err.clear();
        return false;
    }
    info = FileInfo{};
    info.name = remoteBaseName(normalize(remote_path));
    info.is_dir = node.is_dir;
    info.has_size = !node.is_dir;
    info.size = node.data.size();
    info.mtime = node.mtime;
    info.mode = node.mode;
    return true;
}

bool MockSftpClient::chmod(const std::string &remote_path, std::uint32_t mode,
                           std::string &err) {
    if (!ready(err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(normalize(remote_path));
    if (it == fs_->nodes_.end()) {
        err = "Remote path not found: " + remote_path;
        return false;
    }
    it->second.mode = (it->second.mode & ~07777u) | (mode & 07777u);
    return true;
}

bool MockSftpClient::setTimes(const std::string &remote_path,
                              std::uint64_t atime, std::uint64_t mtime,
                              std::string &err) {
    (void)atime;
    if (!ready(err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(normalize(remote_path));
    if (it == fs_->nodes_.end()) {
        err = "Remote path not found: " + remote_path;
        return false;
    }
    it->second.mtime = mtime;
    return true;
}

bool MockSftpClient::mkdir(const std::string &remote_dir, std::string &err,
                           unsigned int mode) {
    if (!ready(err))
        return false;
    const std::string path = normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->nodes_.count(path)) {
        err = "Remote path already exists: " + path;
        return false;
    }
    auto parent = fs_->nodes_.find(remoteParentPath(path));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = "Remote parent directory does not exist: " + path;
        return false;
    }
    MockRemoteFs::Node &n = fs_->nodes_[path];
    n.is_dir = true;
    n.mode = 040000u | (mode & 07777u);
    n.mtime = nowSeconds();
    return true;
}

bool MockSftpClient::removeFile(const std::string &remote_path,
                                std::string &err) {
    if (!ready(err))
        return false;
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(normalize(remote_path));
    if (it == fs_->nodes_.end() || it->second.is_dir) {
        err = "Remote file not found: " + remote_path;
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSftpClient::removeDir(const std::string &remote_dir,
                               std::string &err) {
    if (!ready(err))
        return false;
    const std::string path = normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(path);
    if (it == fs_->nodes_.end() || !it->second.is_dir) {
        err = "Remote directory not found: " + path;
        return false;
    }
    for (const auto &kv : fs_->nodes_) {
        if (kv.first != path && remoteParentPath(kv.first) == path) {
            err = "Remote directory not empty: " + path;
            return false;
        }
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockSftpClient::rename(const std::string &from, const std::string &to,
                            std::string &err, bool overwrite) {
    if (!ready(err))
        return false;
    const std::string src = normalize(from);
    const std::string dst = normalize(to);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    auto it = fs_->nodes_.find(src);
    if (it == fs_->nodes_.end()) {
        err = "Remote path not found: " + src;
        return false;
    }
    if (it->second.is_dir) {
        err = "Renaming directories is not supported by the mock";
        return false;
    }
    if (fs_->nodes_.count(dst) && !overwrite) {
        err = "Destination exists: " + dst;
        return false;
    }
    MockRemoteFs::Node moved = it->second;
    fs_->nodes_.erase(it);
    fs_->nodes_[dst] = std::move(moved);
    return true;
}

bool MockSftpClient::checksum(const std::string &remote_path,
                              ChecksumAlgorithm algorithm, std::string &hexOut,
                              std::string &err) {
    if (!ready(err))
        return false;
    MockRemoteFs::Node node;
    if (!fs_->nodeFor(remote_path, node) || node.is_dir) {
        err = "Remote file not found: " + remote_path;
        return false;
    }
    MockRemoteFs::DigestFn digest;
    {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        digest = fs_->digest_;
    }
    if (!digest) {
        err = "Remote checksum not available";
        return false;
    }
    hexOut = digest(node.data, algorithm);
    return true;
}

std::unique_ptr<SftpClient>
MockSftpClient::newConnectionLike(const SessionOptions &opt, std::string &err) {
    auto conn = std::make_unique<MockSftpClient>(fs_);
    if (!conn->connect(opt, err))
        return nullptr;
    return conn;
}

} // namespace openxfer
