// Delta Diff Engine: compares a local and a remote directory snapshot and
// yields the uploads/deletes needed to bring the remote side in line.
#pragma once
#include "SftpClient.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace openxfer {

enum class DiffAction { Upload, Delete, Unchanged };

enum class DiffReason { None, New, SizeMismatch, MtimeNewer, DeletedLocally };

struct SnapshotEntry {
    std::uint64_t size = 0;
    std::int64_t mtimeMs = 0;
    bool isDirectory = false;
};

// Relative path ("dir/file.txt", '/' separated) -> entry.
using Snapshot = std::map<std::string, SnapshotEntry>;

struct DiffEntry {
    std::string path;
    DiffAction action = DiffAction::Unchanged;
    DiffReason reason = DiffReason::None;
    std::uint64_t size = 0; // size of the side that drives the action
};

struct DiffOptions {
    bool deleteRemote = false;
    // Regular expressions searched in the relative path. A bare '*' is read
    // as a wildcard, so "*.tmp" works as well as ".*\\.tmp".
    std::vector<std::string> excludePatterns;
    // Local mtime must exceed remote by more than this to count as newer.
    std::int64_t mtimeToleranceMs = 1000;
};

struct DiffResult {
    std::vector<DiffEntry> toUpload;
    std::vector<DiffEntry> toDelete;
    std::vector<DiffEntry> unchanged;

    std::uint64_t uploadBytes() const;
};

const char *diffActionName(DiffAction action);
const char *diffReasonName(DiffReason reason);

// node_modules, \.git, \.vscode, .*\.log
std::vector<std::string> defaultExcludePatterns();

// Turns each '*' that does not already quantify something into ".*".
std::string normalizeExcludePattern(const std::string &pattern);

// Directory entries take no part in the comparison; parents are created on
// demand while uploading. Entries come out ordered by path. Fails only when
// an exclude pattern is not a valid regular expression.
bool calculateDiff(const Snapshot &local, const Snapshot &remote,
                   const DiffOptions &options, DiffResult &out,
                   std::string &err);

// Walks remote_root recursively through the session. A missing root yields
// an empty snapshot.
bool buildRemoteSnapshot(SftpClient &client, const std::string &remote_root,
                         Snapshot &out, std::string &err,
                         SftpClient::CancelCB shouldCancel = {});

} // namespace openxfer
