#include "backup.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

BackupManager::BackupManager(GameInstall install, FileOps::RetryPolicy policy)
    : install(std::move(install)), policy(policy), dir(this->install.state_dir / "backup") {}

void BackupManager::Load() {
    std::lock_guard lock(mutex);
    index.clear();
    fs::create_directories(dir / FILES);
    fs::create_directories(dir / ABSENT);

    std::vector<fs::path> stale;
    for (const auto& entry : fs::recursive_directory_iterator(dir / FILES)) {
        try {
            if (!entry.is_regular_file()) continue;
            if (entry.path().string().ends_with(".modlayer-tmp")) {
                stale.push_back(entry.path());
                continue;
            }
            auto rel = entry.path().lexically_relative(dir / FILES).generic_string();
            index[rel] = BackupEntry {
                .path = rel,
                .existed = true,
                .sha256 = Crypto::ComputeFileSHA256(entry.path()),
                .blob = std::format("{}/{}", FILES, rel)
            };
        } catch (const std::exception& ex) {
            Log::Warning("BackupManager::Load", "Skipping unreadable snapshot {} ({})", entry.path().string(), ex.what());
        }
    }

    for (const auto& entry : fs::recursive_directory_iterator(dir / ABSENT)) {
        try {
            if (!entry.is_regular_file()) continue;
            auto marker = entry.path().lexically_relative(dir / ABSENT).generic_string();
            if (!marker.ends_with(ABSENT_SUFFIX)) {
                stale.push_back(entry.path());
                continue;
            }
            auto rel = marker.substr(0, marker.size() - std::string(ABSENT_SUFFIX).size());
            if (index.contains(rel)) {
                // A real snapshot wins over a sentinel
                stale.push_back(entry.path());
                continue;
            }
            auto anchor = FileOps::ReadFile(entry.path());
            index[rel] = BackupEntry {
                .path = rel,
                .existed = false,
                .blob = std::format("{}/{}", ABSENT, marker),
                .anchor = std::string(anchor.begin(), anchor.end())
            };
        } catch (const std::exception& ex) {
            Log::Warning("BackupManager::Load", "Skipping unreadable sentinel {} ({})", entry.path().string(), ex.what());
        }
    }

    for (const auto& path : stale) {
        std::error_code ec;
        fs::remove(path, ec);
    }
    Log::Debug("BackupManager::Load", "{} snapshots indexed for {}", index.size(), install.game_id);
}

bool BackupManager::EnsureCaptured(const std::string& path) {
    {
        std::lock_guard lock(mutex);
        if (index.contains(path)) return false;
    }

    auto target = install.root / path;
    BackupEntry entry { .path = path };

    FileOps::WithRetry(policy, [&] {
        std::error_code ec;
        auto status = fs::symlink_status(target, ec);
        if (status.type() == fs::file_type::not_found) {
            auto ancestor = target.parent_path();
            while (ancestor != install.root && ancestor != ancestor.parent_path() && !fs::is_directory(ancestor, ec)) {
                ancestor = ancestor.parent_path();
            }
            auto anchor = ancestor.lexically_relative(install.root).generic_string();
            entry.existed = false;
            entry.anchor = anchor == "." ? "" : anchor;
            entry.blob = std::format("{}/{}{}", ABSENT, path, ABSENT_SUFFIX);
            FileOps::WriteTextAtomic(dir / entry.blob, entry.anchor);
            return;
        }
        if (ec) throw fs::filesystem_error("Failed to stat", target, ec);
        if (!fs::is_regular_file(target)) {
            throw fs::filesystem_error("Cannot snapshot a non-regular file", target, std::make_error_code(std::errc::invalid_argument));
        }

        entry.existed = true;
        entry.blob = std::format("{}/{}", FILES, path);
        FileOps::CopyFileAtomic(target, dir / entry.blob);
    });

    if (entry.existed) {
        entry.sha256 = Crypto::ComputeFileSHA256(dir / entry.blob);
    }

    std::lock_guard lock(mutex);
    index.emplace(path, entry);
    Log::Debug("BackupManager::EnsureCaptured", "Captured {} ({})", path, entry.existed ? "original" : "absent");
    return true;
}

void BackupManager::Restore(const std::string& path) {
    auto entry = Find(path);
    if (!entry) {
        throw ModException(ErrorKind::BackupMissing, std::format("No snapshot of {}", path), { path });
    }

    auto target = install.root / path;
    if (entry->existed) {
        auto blob = BlobPath(*entry);
        if (!FileOps::Exists(blob)) {
            throw ModException(ErrorKind::BackupMissing, std::format("Snapshot blob of {} is gone", path), { path });
        }
        FileOps::WithRetry(policy, [&] { FileOps::CopyFileAtomic(blob, target); });
    } else {
        FileOps::WithRetry(policy, [&] { FileOps::RemoveFile(target); });
        FileOps::PruneEmptyParents(target, install.root / entry->anchor);
    }
    Log::Debug("BackupManager::Restore", "Restored {}", path);
}

void BackupManager::FullRestore(std::map<std::string, OverlayEntry>& overlay) {
    auto entries = Entries();
    // Deepest paths first so emptied directories can be pruned
    std::sort(entries.begin(), entries.end(), [](const BackupEntry& a, const BackupEntry& b) {
        return a.path > b.path;
    });

    std::vector<std::string> restored;
    std::vector<std::string> failed;
    for (const auto& entry : entries) {
        try {
            Restore(entry.path);
            restored.push_back(entry.path);
        } catch (const std::exception& ex) {
            Log::Error("BackupManager::FullRestore", "Failed to restore {}: {}", entry.path, ex.what());
            failed.push_back(entry.path);
        }
    }

    for (const auto& path : restored) {
        overlay.erase(path);
    }
    Release(restored);

    if (!failed.empty()) {
        throw ModException(
            ErrorKind::UnrecoverableState,
            std::format("{} of {} files could not be restored for {}", failed.size(), entries.size(), install.game_id),
            failed
        );
    }
    Log::Info("BackupManager::FullRestore", "Restored {} files for {}", restored.size(), install.game_id);
}

void BackupManager::Release(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        std::optional<BackupEntry> entry;
        {
            std::lock_guard lock(mutex);
            auto it = index.find(path);
            if (it == index.end()) continue;
            entry = it->second;
            index.erase(it);
        }

        std::error_code ec;
        auto blob = BlobPath(*entry);
        fs::remove(blob, ec);
        if (ec) {
            Log::Warning("BackupManager::Release", "Failed to delete snapshot of {} ({})", path, ec.message());
            continue;
        }
        FileOps::PruneEmptyParents(blob, dir / (entry->existed ? FILES : ABSENT));
    }
}

bool BackupManager::IsCaptured(const std::string& path) const {
    std::lock_guard lock(mutex);
    return index.contains(path);
}

std::optional<BackupEntry> BackupManager::Find(const std::string& path) const {
    std::lock_guard lock(mutex);
    auto it = index.find(path);
    if (it == index.end()) return std::nullopt;
    return it->second;
}

std::vector<BackupEntry> BackupManager::Entries() const {
    std::lock_guard lock(mutex);
    std::vector<BackupEntry> out;
    out.reserve(index.size());
    for (const auto& [path, entry] : index) out.push_back(entry);
    return out;
}

bool BackupManager::MatchesOriginal(const std::string& path) const {
    auto entry = Find(path);
    if (!entry) return false;

    auto target = install.root / path;
    if (!entry->existed) return !FileOps::Exists(target);
    if (!fs::is_regular_file(target)) return false;
    return Crypto::ComputeFileSHA256(target) == entry->sha256;
}
