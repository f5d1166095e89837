#pragma once

#include "backup.hpp"
#include "fileops.hpp"
#include "model.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct ApplyOptions {
    FileOps::RetryPolicy retry;
    bool parallel = false;
    int threads = 4;
};

// Reconciles the game directory with a resolved file set and remembers which
// mod owns each overridden path.
class OverlayEngine {
public:
    OverlayEngine(GameInstall install, BackupManager& backups, ApplyOptions options = {});

    // Transactional: on failure every touched path is put back the way it was
    // and PartialApplyFailure is thrown. UnrecoverableState if that fails too.
    ApplyStats Apply(const ResolvedSet& target);

    void RestoreAll();

    // Overlaid paths whose content no longer matches what was written
    std::vector<std::string> Verify() const;

    const std::map<std::string, OverlayEntry>& Entries() const {
        return entries;
    }
    void SetEntries(std::map<std::string, OverlayEntry> loaded) {
        entries = std::move(loaded);
    }
    std::optional<OverlayEntry> Find(const std::string& path) const;

    // Left over only if a previous apply was interrupted
    void DiscardStash();

private:
    enum class OpKind { Write, Restore };

    struct Op {
        OpKind kind;
        std::string path;
        const ResolvedFile* file = nullptr;
        std::optional<OverlayEntry> prior;
        bool captured = false;
        bool stashed = false;
        bool mutated = false;
        bool ok = false;
        std::string error;
    };

    GameInstall install;
    BackupManager& backups;
    ApplyOptions options;
    std::filesystem::path stash_dir;
    std::map<std::string, OverlayEntry> entries;

    void Run(Op& op);
    void RunAll(std::vector<Op>& ops, size_t begin, size_t end);
    std::vector<std::string> Rollback(std::vector<Op>& ops);
};
