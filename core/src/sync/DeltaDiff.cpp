#include "openxfer/DeltaDiff.hpp"
#include "openxfer/RemotePath.hpp"

#include <regex>

namespace openxfer {

std::uint64_t DiffResult::uploadBytes() const {
    std::uint64_t total = 0;
    for (const auto &e : toUpload)
        total += e.size;
    return total;
}

const char *diffActionName(DiffAction action) {
    switch (action) {
    case DiffAction::Upload:
        return "upload";
    case DiffAction::Delete:
        return "delete";
    case DiffAction::Unchanged:
        return "unchanged";
    }
    return "unknown";
}

const char *diffReasonName(DiffReason reason) {
    switch (reason) {
    case DiffReason::None:
        return "";
    case DiffReason::New:
        return "new";
    case DiffReason::SizeMismatch:
        return "size_mismatch";
    case DiffReason::MtimeNewer:
        return "mtime_newer";
    case DiffReason::DeletedLocally:
        return "deleted_locally";
    }
    return "unknown";
}

std::vector<std::string> defaultExcludePatterns() {
    return {"node_modules", "\\.git", "\\.vscode", ".*\\.log"};
}

std::string normalizeExcludePattern(const std::string &pattern) {
    std::string out;
    out.reserve(pattern.size() + 4);
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        const bool quantifies = i > 0 && (pattern[i - 1] == '.' ||
                                          pattern[i - 1] == '\\' ||
                                          pattern[i - 1] == ')' ||
                                          pattern[i - 1] == ']');
        if (c == '*' && !quantifies)
            out += ".*";
        else
            out += c;
    }
    return out;
}

namespace {

bool compilePatterns(const std::vector<std::string> &patterns,
                     std::vector<std::regex> &out, std::string &err) {
    out.clear();
    out.reserve(patterns.size());
    for (const auto &p : patterns) {
        try {
            out.emplace_back(normalizeExcludePattern(p), std::regex::ECMAScript);
        } catch (const std::regex_error &ex) {
            err = "Invalid exclude pattern '" + p + "': " + ex.what();
            return false;
        }
    }
    return true;
}

bool isExcluded(const std::string &path, const std::vector<std::regex> &rx) {
    for (const auto &r : rx) {
        if (std::regex_search(path, r))
            return true;
    }
    return false;
}

} // namespace

bool calculateDiff(const Snapshot &local, const Snapshot &remote,
                   const DiffOptions &options, DiffResult &out,
                   std::string &err) {
    std::vector<std::regex> excludes;
    if (!compilePatterns(options.excludePatterns, excludes, err))
        return false;

    out = DiffResult{};
    for (const auto &kv : local) {
        const std::string &path = kv.first;
        const SnapshotEntry &l = kv.second;
        if (l.isDirectory || isExcluded(path, excludes))
            continue;

        DiffEntry e;
        e.path = path;
        e.size = l.size;
        auto rit = remote.find(path);
        if (rit == remote.end() || rit->second.isDirectory) {
            e.action = DiffAction::Upload;
            e.reason = DiffReason::New;
            out.toUpload.push_back(std::move(e));
            continue;
        }
        const SnapshotEntry &r = rit->second;
        if (l.size != r.size) {
            e.action = DiffAction::Upload;
            e.reason = DiffReason::SizeMismatch;
            out.toUpload.push_back(std::move(e));
        } else if (l.mtimeMs - r.mtimeMs > options.mtimeToleranceMs) {
            e.action = DiffAction::Upload;
            e.reason = DiffReason::MtimeNewer;
            out.toUpload.push_back(std::move(e));
        } else {
            out.unchanged.push_back(std::move(e));
        }
    }

    if (!options.deleteRemote)
        return true;
    for (const auto &kv : remote) {
        const std::string &path = kv.first;
        if (kv.second.isDirectory || isExcluded(path, excludes))
            continue;
        auto lit = local.find(path);
        if (lit != local.end() && !lit->second.isDirectory)
            continue;
        DiffEntry e;
        e.path = path;
        e.size = kv.second.size;
        e.action = DiffAction::Delete;
        e.reason = DiffReason::DeletedLocally;
        out.toDelete.push_back(std::move(e));
    }
    return true;
}

namespace {

bool walkRemote(SftpClient &client, const std::string &dir,
                const std::string &prefix, Snapshot &out, std::string &err,
                const SftpClient::CancelCB &shouldCancel) {
    if (shouldCancel && shouldCancel()) {
        err = "Canceled";
        return false;
    }
    std::vector<FileInfo> entries;
    if (!client.list(dir, entries, err))
        return false;
    for (const auto &fi : entries) {
        const std::string rel = prefix.empty() ? fi.name : prefix + "/" + fi.name;
        SnapshotEntry e;
        e.size = fi.size;
        e.mtimeMs = static_cast<std::int64_t>(fi.mtime) * 1000;
        e.isDirectory = fi.is_dir;
        out[rel] = e;
        if (fi.is_dir &&
            !walkRemote(client, joinRemotePath(dir, fi.name), rel, out, err,
                        shouldCancel))
            return false;
    }
    return true;
}

} // namespace

bool buildRemoteSnapshot(SftpClient &client, const std::string &remote_root,
                         Snapshot &out, std::string &err,
                         SftpClient::CancelCB shouldCancel) {
    out.clear();
    bool isDir = false;
    std::string e;
    if (!client.exists(remote_root, isDir, e)) {
        if (!e.empty()) {
            err = e;
            return false;
        }
        return true;
    }
    if (!isDir) {
        err = "Remote path is not a directory: " + remote_root;
        return false;
    }
    return walkRemote(client, remote_root, std::string(), out, err,
                      shouldCancel);
}

} // namespace openxfer
