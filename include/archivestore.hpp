#pragma once

#include "model.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

class ArchiveStore {
public:
    explicit ArchiveStore(std::filesystem::path root);

    // Reads every per-mod manifest below the store root
    void Load();

    // Accepts a mod folder or a .zip archive. Re-registering a mod with the
    // exact same name replaces it wholesale; a different name whose slug is
    // already taken gets a numbered id ("better_cars_2").
    std::string Register(const std::filesystem::path& payload);

    Mod Get(const std::string& id) const;
    bool Contains(const std::string& id) const;
    std::vector<Mod> List() const;

    // Mods in the given order; DanglingModReference lists unknown ids
    std::vector<Mod> Resolve(const std::vector<std::string>& ids) const;

    void Remove(const std::string& id, const std::function<bool(const std::string&)>& in_use);

    static std::string MakeId(const std::string& name);

private:
    struct PayloadEntry {
        std::string rel;
        std::filesystem::path source;
        uint64_t zip_index = 0;
    };

    struct Payload {
        bool is_zip = false;
        std::string metadata;
        std::string fallback_name;
        std::vector<PayloadEntry> entries;
    };

    std::filesystem::path root;
    mutable std::shared_mutex mutex;
    std::map<std::string, Mod> mods;

    // Caller holds the lock
    std::string AssignId(const std::string& name) const;

    static Payload ScanDirectory(const std::filesystem::path& payload);
    static Payload ScanZip(const std::filesystem::path& payload);
    static void ApplyMetadata(Mod& mod, const std::string& metadata);
    static void ExtractZip(const std::filesystem::path& payload, const std::vector<PayloadEntry>& entries, const std::filesystem::path& out);

    static Mod ReadManifest(const std::filesystem::path& mod_dir);
    static void WriteManifest(const Mod& mod, const std::filesystem::path& mod_dir);
};
