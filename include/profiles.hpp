#pragma once

#include "archivestore.hpp"
#include "model.hpp"
#include "overlay.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Named load orders for one install and the NoProfileActive/ProfileActive
// state machine that drives the overlay.
class ProfileManager {
public:
    ProfileManager(ArchiveStore& store, OverlayEngine& overlay);

    void Load(std::vector<Profile> loaded, std::optional<std::string> active_id);

    std::string Create(const std::string& name);
    void Rename(const std::string& id, const std::string& name);
    std::string Duplicate(const std::string& id, std::optional<std::string> name = std::nullopt);
    void Delete(const std::string& id);

    // Replaces the whole ordered mod list (lowest priority first)
    void Reorder(const std::string& id, const std::vector<std::string>& mods);
    void EnableMod(const std::string& id, const std::string& mod_id, std::optional<size_t> position = std::nullopt);
    void DisableMod(const std::string& id, const std::string& mod_id);

    void Export(const std::string& id, const std::filesystem::path& path) const;
    std::string Import(const std::filesystem::path& path);

    Profile Get(const std::string& id) const;
    const std::vector<Profile>& List() const {
        return profiles;
    }

    std::vector<Conflict> Conflicts(const std::string& id) const;

    ApplyStats Activate(const std::string& id);
    // Diffed against what is applied now, not deactivate + activate
    ApplyStats Switch(const std::string& id);
    ApplyStats Deactivate();
    void MarkInactive() {
        active.reset();
    }

    std::optional<std::string> ActiveProfile() const {
        return active;
    }
    bool ActiveReferences(const std::string& mod_id) const;

private:
    ArchiveStore& store;
    OverlayEngine& overlay;
    std::vector<Profile> profiles;
    std::optional<std::string> active;

    Profile& Find(const std::string& id);
    const Profile& Find(const std::string& id) const;
    std::string ImportedName(const std::string& base) const;
};
