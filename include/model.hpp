#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

struct ModFile {
    std::string path;
    std::string sha256;
    uint64_t size = 0;
};

struct Mod {
    std::string id;
    std::string name;
    std::string description;
    std::string version = "N/A";
    std::string author = "Unknown";
    std::string game;
    std::string category = "Uncategorized";
    // Sorted by path
    std::vector<ModFile> files;
    long long installed_at = 0;
    std::filesystem::path payload_dir;

    const ModFile* Find(const std::string& path) const;
    std::filesystem::path SourceOf(const std::string& path) const {
        return payload_dir / path;
    }
};

struct ModSummary {
    std::string id;
    std::string name;
    std::string version;
    std::string author;
    std::string category;
    size_t file_count = 0;
    long long installed_at = 0;
};

struct Profile {
    std::string id;
    std::string name;
    // Lowest priority first
    std::vector<std::string> mods;
    long long last_modified = 0;
};

struct OverlayEntry {
    std::string path;
    std::string mod_id;
    std::string sha256;
    std::string backup_ref;
};

struct BackupEntry {
    std::string path;
    bool existed = false;
    std::string sha256;
    // Relative to the backup directory
    std::string blob;
    // For absent paths: deepest ancestor directory that existed at capture
    std::string anchor;
};

struct GameInstall {
    std::string game_id;
    std::filesystem::path root;
    std::filesystem::path state_dir;
};

struct ResolvedFile {
    std::string mod_id;
    std::string sha256;
    std::filesystem::path source;
};

using ResolvedSet = std::map<std::string, ResolvedFile>;

struct Conflict {
    std::string path;
    std::string winner;
    std::vector<std::string> losers;
};

struct ApplyStats {
    size_t written = 0;
    size_t restored = 0;
    size_t unchanged = 0;
};

long long UnixNow();
