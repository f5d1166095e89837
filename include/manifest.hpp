#pragma once

#include "model.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Per-install index written after every mutation. It is a cache: mods and
// backups are re-derived from their own files on disk.
struct ManifestData {
    static constexpr int VERSION = 1;

    std::string game_id;
    std::string root;
    std::vector<Mod> mods;
    std::vector<Profile> profiles;
    std::optional<std::string> active_profile;
    std::map<std::string, OverlayEntry> overlay;
    std::vector<BackupEntry> backups;
};

namespace Manifest {
    // Empty when the file is missing or unreadable
    std::optional<ManifestData> Load(const std::filesystem::path& path);
    void Save(const std::filesystem::path& path, const ManifestData& data);
}
