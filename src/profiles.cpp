#include "profiles.hpp"
#include "conflicts.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "fileops.hpp"
#include "log.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
    void RequireName(const std::string& name) {
        if (name.find_first_not_of(" \t") == std::string::npos) {
            throw std::invalid_argument("Profile name must not be empty");
        }
    }

    void RequireUnique(const std::vector<std::string>& mods) {
        std::set<std::string> seen;
        for (const auto& id : mods) {
            if (!seen.insert(id).second) {
                throw std::invalid_argument(std::format("Mod {} appears more than once in the load order", id));
            }
        }
    }
}

ProfileManager::ProfileManager(ArchiveStore& store, OverlayEngine& overlay) : store(store), overlay(overlay) {}

void ProfileManager::Load(std::vector<Profile> loaded, std::optional<std::string> active_id) {
    profiles = std::move(loaded);
    active.reset();
    if (active_id) {
        auto it = std::find_if(profiles.begin(), profiles.end(), [&](const Profile& p) { return p.id == *active_id; });
        if (it != profiles.end()) {
            active = active_id;
        } else {
            Log::Warning("ProfileManager::Load", "Active profile {} no longer exists", *active_id);
        }
    }
}

Profile& ProfileManager::Find(const std::string& id) {
    auto it = std::find_if(profiles.begin(), profiles.end(), [&](const Profile& p) { return p.id == id; });
    if (it == profiles.end()) {
        throw ModException(ErrorKind::NotFound, std::format("Profile {} does not exist", id), { id });
    }
    return *it;
}

const Profile& ProfileManager::Find(const std::string& id) const {
    return const_cast<ProfileManager*>(this)->Find(id);
}

Profile ProfileManager::Get(const std::string& id) const {
    return Find(id);
}

std::string ProfileManager::Create(const std::string& name) {
    RequireName(name);
    Profile profile {
        .id = Crypto::RandomHex(8),
        .name = name,
        .last_modified = UnixNow()
    };
    profiles.push_back(profile);
    Log::Info("ProfileManager::Create", "Created profile {} ({})", profile.name, profile.id);
    return profile.id;
}

void ProfileManager::Rename(const std::string& id, const std::string& name) {
    RequireName(name);
    auto& profile = Find(id);
    profile.name = name;
    profile.last_modified = UnixNow();
}

std::string ProfileManager::Duplicate(const std::string& id, std::optional<std::string> name) {
    const auto& source = Find(id);
    Profile copy {
        .id = Crypto::RandomHex(8),
        .name = name.value_or(std::format("{} (Copy)", source.name)),
        .mods = source.mods,
        .last_modified = UnixNow()
    };
    RequireName(copy.name);
    profiles.push_back(copy);
    return copy.id;
}

void ProfileManager::Delete(const std::string& id) {
    Find(id);
    if (active == id) {
        throw ModException(ErrorKind::InUse, std::format("Profile {} is active; deactivate it first", id), { id });
    }
    std::erase_if(profiles, [&](const Profile& p) { return p.id == id; });
    Log::Info("ProfileManager::Delete", "Deleted profile {}", id);
}

void ProfileManager::Reorder(const std::string& id, const std::vector<std::string>& mods) {
    RequireUnique(mods);
    auto& profile = Find(id);
    profile.mods = mods;
    profile.last_modified = UnixNow();
}

void ProfileManager::EnableMod(const std::string& id, const std::string& mod_id, std::optional<size_t> position) {
    auto& profile = Find(id);
    if (!store.Contains(mod_id)) {
        throw ModException(ErrorKind::NotFound, std::format("Mod {} is not registered", mod_id), { mod_id });
    }

    std::erase(profile.mods, mod_id);
    size_t at = std::min(position.value_or(profile.mods.size()), profile.mods.size());
    profile.mods.insert(profile.mods.begin() + at, mod_id);
    profile.last_modified = UnixNow();
}

void ProfileManager::DisableMod(const std::string& id, const std::string& mod_id) {
    auto& profile = Find(id);
    if (std::erase(profile.mods, mod_id) > 0) {
        profile.last_modified = UnixNow();
    }
}

void ProfileManager::Export(const std::string& id, const std::filesystem::path& path) const {
    const auto& profile = Find(id);
    json j = {
        { "id", profile.id },
        { "name", profile.name },
        { "last_modified", profile.last_modified },
        { "mods", profile.mods }
    };
    FileOps::WriteTextAtomic(path, j.dump(4));
    Log::Info("ProfileManager::Export", "Exported profile {} to {}", profile.name, path.string());
}

std::string ProfileManager::ImportedName(const std::string& base) const {
    auto taken = [&](const std::string& name) {
        return std::any_of(profiles.begin(), profiles.end(), [&](const Profile& p) { return p.name == name; });
    };
    std::string name = base;
    for (int counter = 1; taken(name); counter++) {
        name = std::format("{} (Imported {})", base, counter);
    }
    return name;
}

std::string ProfileManager::Import(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw ModException(ErrorKind::NotFound, std::format("Profile file {} does not exist", path.string()), { path.string() });
    }

    std::ifstream stream(path);
    json j = json::parse(stream, nullptr, false);
    if (!j.is_object() || !j.contains("mods") || !j["mods"].is_array()) {
        throw std::invalid_argument(std::format("{} is not a profile export", path.string()));
    }

    std::vector<std::string> mods;
    for (const auto& m : j["mods"]) {
        if (!m.is_string()) throw std::invalid_argument(std::format("{} lists a non-string mod id", path.string()));
        mods.push_back(m.get<std::string>());
    }
    RequireUnique(mods);

    auto base = j.value("name", std::string("Imported Profile"));
    if (base.find_first_not_of(" \t") == std::string::npos) base = "Imported Profile";

    Profile profile {
        .id = Crypto::RandomHex(8),
        .name = ImportedName(base),
        .mods = std::move(mods),
        .last_modified = UnixNow()
    };
    profiles.push_back(profile);
    Log::Info("ProfileManager::Import", "Imported profile {} ({} mods)", profile.name, profile.mods.size());
    return profile.id;
}

std::vector<Conflict> ProfileManager::Conflicts(const std::string& id) const {
    const auto& profile = Find(id);

    std::vector<Mod> ordered;
    for (const auto& mod_id : profile.mods) {
        try {
            ordered.push_back(store.Get(mod_id));
        } catch (const ModException& ex) {
            if (ex.kind != ErrorKind::NotFound) throw;
            Log::Warning("ProfileManager::Conflicts", "Profile {} references missing mod {}", profile.name, mod_id);
        }
    }
    return ConflictDetector::ConflictsFor(ordered);
}

ApplyStats ProfileManager::Activate(const std::string& id) {
    const auto profile = Get(id);
    auto mods = store.Resolve(profile.mods);
    auto resolved = ConflictDetector::Resolve(mods);

    try {
        auto stats = overlay.Apply(resolved);
        active = id;
        Log::Info("ProfileManager::Activate", "Profile {} is active", profile.name);
        return stats;
    } catch (const ModException& ex) {
        if (ex.kind == ErrorKind::UnrecoverableState) {
            // Neither the old nor the new profile is faithfully applied
            active.reset();
        }
        throw;
    }
}

ApplyStats ProfileManager::Switch(const std::string& id) {
    if (active) {
        Log::Debug("ProfileManager::Switch", "Switching from {} to {}", *active, id);
    }
    return Activate(id);
}

ApplyStats ProfileManager::Deactivate() {
    try {
        auto stats = overlay.Apply({});
        active.reset();
        return stats;
    } catch (const ModException& ex) {
        if (ex.kind == ErrorKind::UnrecoverableState) active.reset();
        throw;
    }
}

bool ProfileManager::ActiveReferences(const std::string& mod_id) const {
    if (!active) return false;
    const auto& mods = Find(*active).mods;
    return std::find(mods.begin(), mods.end(), mod_id) != mods.end();
}
