#include "overlay.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <format>
#include <thread>

namespace fs = std::filesystem;

OverlayEngine::OverlayEngine(GameInstall install, BackupManager& backups, ApplyOptions options)
    : install(std::move(install)), backups(backups), options(options), stash_dir(this->install.state_dir / "stash") {}

std::optional<OverlayEntry> OverlayEngine::Find(const std::string& path) const {
    auto it = entries.find(path);
    if (it == entries.end()) return std::nullopt;
    return it->second;
}

void OverlayEngine::DiscardStash() {
    std::error_code ec;
    fs::remove_all(stash_dir, ec);
    if (ec) {
        Log::Warning("OverlayEngine::DiscardStash", "Failed to clear {} ({})", stash_dir.string(), ec.message());
    }
}

void OverlayEngine::Run(Op& op) {
    auto target = install.root / op.path;
    try {
        if (op.prior) {
            // The current content belongs to a mod; keep it in case we roll back
            if (FileOps::Exists(target)) {
                FileOps::WithRetry(options.retry, [&] { FileOps::CopyFileAtomic(target, stash_dir / op.path); });
                op.stashed = true;
            }
        } else {
            op.captured = backups.EnsureCaptured(op.path);
        }

        op.mutated = true;
        if (op.kind == OpKind::Write) {
            FileOps::WithRetry(options.retry, [&] { FileOps::CopyFileAtomic(op.file->source, target); });
        } else {
            backups.Restore(op.path);
        }
        op.ok = true;
    } catch (const std::exception& ex) {
        op.error = ex.what();
        Log::Error("OverlayEngine::Run", "{} {} failed: {}", op.kind == OpKind::Write ? "Writing" : "Restoring", op.path, op.error);
    }
}

void OverlayEngine::RunAll(std::vector<Op>& ops, size_t begin, size_t end) {
    size_t count = end - begin;
    size_t workers = options.parallel ? std::min<size_t>(std::max(options.threads, 1), count) : 1;

    if (workers <= 1) {
        for (size_t i = begin; i < end; i++) Run(ops[i]);
        return;
    }

    std::vector<std::thread> threads;
    for (size_t w = 0; w < workers; w++) {
        threads.emplace_back([&, w] {
            for (size_t i = begin + w; i < end; i += workers) Run(ops[i]);
        });
    }
    for (auto& t : threads) {
        t.join();
    }
}

std::vector<std::string> OverlayEngine::Rollback(std::vector<Op>& ops) {
    std::vector<std::string> failed;
    std::vector<std::string> release;

    for (auto it = ops.rbegin(); it != ops.rend(); ++it) {
        auto& op = *it;
        if (!op.mutated) continue;

        auto target = install.root / op.path;
        try {
            if (op.prior) {
                if (op.stashed) {
                    FileOps::WithRetry(options.retry, [&] { FileOps::CopyFileAtomic(stash_dir / op.path, target); });
                } else {
                    FileOps::WithRetry(options.retry, [&] { FileOps::RemoveFile(target); });
                }
            } else {
                backups.Restore(op.path);
                if (op.captured) release.push_back(op.path);
            }
        } catch (const std::exception& ex) {
            Log::Error("OverlayEngine::Rollback", "Failed to roll back {}: {}", op.path, ex.what());
            failed.push_back(op.path);
        }
    }

    backups.Release(release);
    return failed;
}

ApplyStats OverlayEngine::Apply(const ResolvedSet& target) {
    ApplyStats stats;
    std::vector<Op> ops;

    for (const auto& [path, entry] : entries) {
        if (!target.contains(path)) {
            ops.push_back(Op { .kind = OpKind::Restore, .path = path, .prior = entry });
        }
    }
    size_t restore_count = ops.size();

    for (const auto& [path, file] : target) {
        auto it = entries.find(path);
        if (it != entries.end() && it->second.mod_id == file.mod_id && it->second.sha256 == file.sha256) {
            stats.unchanged++;
            continue;
        }
        Op op { .kind = OpKind::Write, .path = path, .file = &file };
        if (it != entries.end()) op.prior = it->second;
        ops.push_back(std::move(op));
    }

    if (ops.empty()) {
        Log::Debug("OverlayEngine::Apply", "Overlay already up to date ({} files)", stats.unchanged);
        return stats;
    }

    Log::Info("OverlayEngine::Apply", "Applying overlay to {}: {} to restore, {} to write", install.game_id, restore_count, ops.size() - restore_count);
    DiscardStash();

    // Restores go first so a path freed by one mod can become a directory for another
    RunAll(ops, 0, restore_count);
    bool restores_ok = std::all_of(ops.begin(), ops.begin() + restore_count, [](const Op& op) { return op.ok; });
    if (restores_ok) {
        RunAll(ops, restore_count, ops.size());
    }

    std::vector<std::string> failed;
    for (const auto& op : ops) {
        if (!op.ok && (op.mutated || !op.error.empty())) failed.push_back(op.path);
    }

    if (!failed.empty()) {
        auto unrecovered = Rollback(ops);
        if (!unrecovered.empty()) {
            throw ModException(
                ErrorKind::UnrecoverableState,
                std::format("Rollback failed for {} files in {}; restore the install to vanilla", unrecovered.size(), install.root.string()),
                unrecovered
            );
        }
        DiscardStash();
        throw ModException(
            ErrorKind::PartialApplyFailure,
            std::format("{} files could not be applied; all changes were rolled back", failed.size()),
            failed
        );
    }

    std::vector<std::string> released;
    for (const auto& op : ops) {
        if (op.kind == OpKind::Restore) {
            entries.erase(op.path);
            released.push_back(op.path);
            stats.restored++;
        } else {
            auto backup = backups.Find(op.path);
            entries[op.path] = OverlayEntry {
                .path = op.path,
                .mod_id = op.file->mod_id,
                .sha256 = op.file->sha256,
                .backup_ref = backup ? backup->blob : ""
            };
            stats.written++;
        }
    }
    backups.Release(released);
    DiscardStash();

    Log::Info("OverlayEngine::Apply", "Overlay applied: {} written, {} restored, {} unchanged", stats.written, stats.restored, stats.unchanged);
    return stats;
}

void OverlayEngine::RestoreAll() {
    backups.FullRestore(entries);
    DiscardStash();
}

std::vector<std::string> OverlayEngine::Verify() const {
    std::vector<std::string> drifted;
    for (const auto& [path, entry] : entries) {
        auto target = install.root / path;
        try {
            if (!fs::is_regular_file(target) || Crypto::ComputeFileSHA256(target) != entry.sha256) {
                drifted.push_back(path);
            }
        } catch (const std::exception& ex) {
            Log::Warning("OverlayEngine::Verify", "Could not read {} ({})", path, ex.what());
            drifted.push_back(path);
        }
    }
    Log::Info("OverlayEngine::Verify", "Verified {} files, {} drifted", entries.size(), drifted.size());
    return drifted;
}
