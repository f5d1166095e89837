#pragma once

#include "archivestore.hpp"
#include "backup.hpp"
#include "model.hpp"
#include "overlay.hpp"
#include "profiles.hpp"

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

// Everything the front end can do to one game install. Mutations hold the
// install lock exclusively for their whole duration; queries share it.
class ModManager {
public:
    explicit ModManager(GameInstall install);
    ModManager(GameInstall install, ApplyOptions options);

    ModManager(const ModManager&) = delete;
    ModManager& operator=(const ModManager&) = delete;

    // Fills in state_dir from the configured state root when it is empty
    static GameInstall MakeInstall(const std::string& game_id, const std::filesystem::path& root, const std::filesystem::path& state_dir = {});
    static ApplyOptions OptionsFromConfig();

    const GameInstall& Install() const {
        return install;
    }

    std::string RegisterMod(const std::filesystem::path& payload);
    std::vector<ModSummary> ListMods() const;
    Mod GetMod(const std::string& id) const;
    void RemoveMod(const std::string& id);

    std::string CreateProfile(const std::string& name);
    void RenameProfile(const std::string& id, const std::string& name);
    std::string DuplicateProfile(const std::string& id, std::optional<std::string> name = std::nullopt);
    void DeleteProfile(const std::string& id);
    void ReorderProfile(const std::string& id, const std::vector<std::string>& mods);
    void EnableMod(const std::string& id, const std::string& mod_id, std::optional<size_t> position = std::nullopt);
    void DisableMod(const std::string& id, const std::string& mod_id);
    void ExportProfile(const std::string& id, const std::filesystem::path& path) const;
    std::string ImportProfile(const std::filesystem::path& path);
    std::vector<Profile> ListProfiles() const;
    Profile GetProfile(const std::string& id) const;
    std::optional<std::string> ActiveProfile() const;

    ApplyStats ActivateProfile(const std::string& id);
    ApplyStats SwitchProfile(const std::string& id);
    ApplyStats DeactivateProfile();
    std::vector<Conflict> GetConflicts(const std::string& id) const;
    void RestoreVanilla();

    std::vector<std::string> VerifyOverlay() const;
    std::vector<OverlayEntry> OverlayEntries() const;
    std::vector<BackupEntry> BackupEntries() const;

    std::filesystem::path ManifestPath() const {
        return install.state_dir / "manifest.json";
    }
    std::filesystem::path JournalPath() const {
        return install.state_dir / "apply.journal";
    }

private:
    GameInstall install;
    mutable std::shared_mutex mutex;
    ArchiveStore store;
    BackupManager backups;
    OverlayEngine overlay;
    ProfileManager profiles;

    void Open();
    void Save();
    void RederiveOverlay();
    void Recover(const char* operation);

    // Runs an overlay transition under the exclusive lock with the journal in place
    template<typename Fn>
    auto Transition(const char* operation, Fn&& fn) -> decltype(fn());
};
