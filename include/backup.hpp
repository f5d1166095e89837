#pragma once

#include "fileops.hpp"
#include "model.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Pristine copies of every game path the overlay touches. The blobs under
// <state_dir>/backup are authoritative; the in-memory index is rebuilt from them.
class BackupManager {
public:
    BackupManager(GameInstall install, FileOps::RetryPolicy policy = {});
    virtual ~BackupManager() = default;

    void Load();

    // Returns true when a new snapshot was taken, false if one already existed
    virtual bool EnsureCaptured(const std::string& path);

    // BackupMissing if the path was never captured or its blob is gone
    virtual void Restore(const std::string& path);

    // Restores every captured path, then drops overlay entries and releases
    // the snapshots of the restored paths. Paths that fail keep both.
    void FullRestore(std::map<std::string, OverlayEntry>& overlay);

    // Forget snapshots of paths that are back to their original content
    void Release(const std::vector<std::string>& paths);

    bool IsCaptured(const std::string& path) const;
    std::optional<BackupEntry> Find(const std::string& path) const;
    std::vector<BackupEntry> Entries() const;

    // True when the game file equals its snapshot (or is absent as recorded)
    bool MatchesOriginal(const std::string& path) const;

    const std::filesystem::path& Directory() const {
        return dir;
    }

private:
    GameInstall install;
    FileOps::RetryPolicy policy;
    std::filesystem::path dir;
    mutable std::mutex mutex;
    std::map<std::string, BackupEntry> index;

    static constexpr const char* FILES = "files";
    static constexpr const char* ABSENT = "absent";
    static constexpr const char* ABSENT_SUFFIX = ".absent";

    std::filesystem::path BlobPath(const BackupEntry& entry) const {
        return dir / entry.blob;
    }
};
