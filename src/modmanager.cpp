#include "modmanager.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "fileops.hpp"
#include "log.hpp"
#include "manifest.hpp"
#include "paths.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>
#include <type_traits>

namespace fs = std::filesystem;

namespace {
    fs::path NormalizeDirectory(const fs::path& path) {
        auto normal = fs::absolute(path).lexically_normal();
        if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
            normal = normal.parent_path();
        }
        return normal;
    }

    GameInstall Normalize(GameInstall install) {
        install.root = NormalizeDirectory(install.root);
        install.state_dir = NormalizeDirectory(install.state_dir);

        if (!fs::is_directory(install.root)) {
            throw ModException(ErrorKind::NotFound, std::format("Game directory {} does not exist", install.root.string()), { install.root.string() });
        }
        if (install.state_dir == install.root || install.state_dir.generic_string().starts_with(install.root.generic_string() + "/")) {
            throw std::invalid_argument("The state directory must live outside the game directory");
        }
        fs::create_directories(install.state_dir);
        return install;
    }
}

ModManager::ModManager(GameInstall install) : ModManager(std::move(install), OptionsFromConfig()) {}

ModManager::ModManager(GameInstall install, ApplyOptions options)
    : install(Normalize(std::move(install))),
      store(this->install.state_dir / "mods"),
      backups(this->install, options.retry),
      overlay(this->install, backups, options),
      profiles(store, overlay) {
    Open();
}

GameInstall ModManager::MakeInstall(const std::string& game_id, const fs::path& root, const fs::path& state_dir) {
    GameInstall install { .game_id = game_id, .root = root, .state_dir = state_dir };
    if (install.state_dir.empty()) {
        auto state_root = Config::GetInstance()->state_root;
        install.state_dir = (state_root.empty() ? Paths::StateDirectory : fs::path(state_root)) / ArchiveStore::MakeId(game_id);
    }
    return install;
}

ApplyOptions ModManager::OptionsFromConfig() {
    auto config = Config::GetInstance();
    return ApplyOptions {
        .retry = FileOps::RetryPolicy { .retries = config->io_retries, .delay_ms = config->io_retry_delay_ms },
        .parallel = config->parallel_apply,
        .threads = config->apply_threads
    };
}

void ModManager::Open() {
    store.Load();
    backups.Load();

    auto data = Manifest::Load(ManifestPath());
    bool interrupted = FileOps::Exists(JournalPath());

    if (data) {
        if (data->game_id != install.game_id || data->root != install.root.generic_string()) {
            Log::Warning("ModManager::Open", "Manifest was written for {} at {}", data->game_id, data->root);
        }
        profiles.Load(data->profiles, data->active_profile);
    }

    if (data && !interrupted) {
        std::map<std::string, OverlayEntry> entries;
        for (const auto& [path, entry] : data->overlay) {
            if (!backups.IsCaptured(path)) {
                Log::Error("ModManager::Open", "Overlay entry {} has no snapshot; dropping it", path);
                continue;
            }
            entries.emplace(path, entry);
        }
        overlay.SetEntries(std::move(entries));
    } else {
        if (interrupted) {
            auto journal = FileOps::ReadFile(JournalPath());
            Log::Warning("ModManager::Open", "Interrupted operation found for {} ({}); rebuilding overlay state from disk", install.game_id, std::string(journal.begin(), journal.end()));
        } else {
            Log::Warning("ModManager::Open", "No usable manifest for {}; rebuilding overlay state from disk", install.game_id);
        }
        RederiveOverlay();
    }

    overlay.DiscardStash();
    Save();
    FileOps::RemoveFile(JournalPath());
    Log::Info("ModManager::Open", "Opened {} ({} mods, {} profiles, {} overlaid files)", install.game_id, store.List().size(), profiles.List().size(), overlay.Entries().size());
}

void ModManager::RederiveOverlay() {
    std::vector<Mod> candidates;
    if (auto active = profiles.ActiveProfile()) {
        auto order = profiles.Get(*active).mods;
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            if (store.Contains(*it)) candidates.push_back(store.Get(*it));
        }
    }
    for (const auto& mod : store.List()) {
        candidates.push_back(mod);
    }

    std::map<std::string, OverlayEntry> entries;
    std::vector<std::string> pristine;
    for (const auto& backup : backups.Entries()) {
        if (backups.MatchesOriginal(backup.path)) {
            pristine.push_back(backup.path);
            continue;
        }

        auto target = install.root / backup.path;
        std::string sha256 = fs::is_regular_file(target) ? Crypto::ComputeFileSHA256(target) : "";

        OverlayEntry entry { .path = backup.path, .sha256 = sha256, .backup_ref = backup.blob };
        for (const auto& mod : candidates) {
            auto file = mod.Find(backup.path);
            if (file != nullptr && file->sha256 == sha256) {
                entry.mod_id = mod.id;
                break;
            }
        }
        if (entry.mod_id.empty()) {
            Log::Warning("ModManager::RederiveOverlay", "{} matches neither its snapshot nor any mod", backup.path);
        }
        entries.emplace(backup.path, std::move(entry));
    }

    backups.Release(pristine);
    overlay.SetEntries(std::move(entries));
    Log::Info("ModManager::RederiveOverlay", "Re-derived {} overlay entries, released {} pristine snapshots", overlay.Entries().size(), pristine.size());
}

void ModManager::Save() {
    ManifestData data {
        .game_id = install.game_id,
        .root = install.root.generic_string(),
        .mods = store.List(),
        .profiles = profiles.List(),
        .active_profile = profiles.ActiveProfile(),
        .overlay = overlay.Entries(),
        .backups = backups.Entries()
    };
    Manifest::Save(ManifestPath(), data);
}

void ModManager::Recover(const char* operation) {
    // The in-memory overlay table no longer describes the disk
    try {
        RederiveOverlay();
        overlay.DiscardStash();
        Save();
        FileOps::RemoveFile(JournalPath());
    } catch (const std::exception& ex) {
        Log::Error("ModManager::Recover", "Could not rebuild state after failed {} ({}); it will be rebuilt on next open", operation, ex.what());
    }
}

template<typename Fn>
auto ModManager::Transition(const char* operation, Fn&& fn) -> decltype(fn()) {
    std::unique_lock lock(mutex);
    FileOps::WriteTextAtomic(JournalPath(), std::format("{} {}", operation, UnixNow()));

    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            Save();
            FileOps::RemoveFile(JournalPath());
        } else {
            auto result = fn();
            Save();
            FileOps::RemoveFile(JournalPath());
            return result;
        }
    } catch (const ModException& ex) {
        if (ex.kind == ErrorKind::UnrecoverableState) {
            Log::Error("ModManager::Transition", "{} left {} in an unknown state; run a full restore", operation, install.game_id);
            Recover(operation);
        } else {
            FileOps::RemoveFile(JournalPath());
        }
        throw;
    } catch (const std::exception&) {
        FileOps::RemoveFile(JournalPath());
        throw;
    }
}

std::string ModManager::RegisterMod(const fs::path& payload) {
    std::unique_lock lock(mutex);
    auto id = store.Register(payload);
    Save();
    return id;
}

std::vector<ModSummary> ModManager::ListMods() const {
    std::shared_lock lock(mutex);
    std::vector<ModSummary> summaries;
    for (const auto& mod : store.List()) {
        summaries.push_back(ModSummary {
            .id = mod.id,
            .name = mod.name,
            .version = mod.version,
            .author = mod.author,
            .category = mod.category,
            .file_count = mod.files.size(),
            .installed_at = mod.installed_at
        });
    }
    return summaries;
}

Mod ModManager::GetMod(const std::string& id) const {
    std::shared_lock lock(mutex);
    return store.Get(id);
}

void ModManager::RemoveMod(const std::string& id) {
    std::unique_lock lock(mutex);
    store.Remove(id, [this](const std::string& mod_id) {
        return profiles.ActiveReferences(mod_id);
    });
    Save();
}

std::string ModManager::CreateProfile(const std::string& name) {
    std::unique_lock lock(mutex);
    auto id = profiles.Create(name);
    Save();
    return id;
}

void ModManager::RenameProfile(const std::string& id, const std::string& name) {
    std::unique_lock lock(mutex);
    profiles.Rename(id, name);
    Save();
}

std::string ModManager::DuplicateProfile(const std::string& id, std::optional<std::string> name) {
    std::unique_lock lock(mutex);
    auto copy = profiles.Duplicate(id, std::move(name));
    Save();
    return copy;
}

void ModManager::DeleteProfile(const std::string& id) {
    std::unique_lock lock(mutex);
    profiles.Delete(id);
    Save();
}

void ModManager::ReorderProfile(const std::string& id, const std::vector<std::string>& mods) {
    std::unique_lock lock(mutex);
    profiles.Reorder(id, mods);
    Save();
}

void ModManager::EnableMod(const std::string& id, const std::string& mod_id, std::optional<size_t> position) {
    std::unique_lock lock(mutex);
    profiles.EnableMod(id, mod_id, position);
    Save();
}

void ModManager::DisableMod(const std::string& id, const std::string& mod_id) {
    std::unique_lock lock(mutex);
    profiles.DisableMod(id, mod_id);
    Save();
}

void ModManager::ExportProfile(const std::string& id, const fs::path& path) const {
    std::shared_lock lock(mutex);
    profiles.Export(id, path);
}

std::string ModManager::ImportProfile(const fs::path& path) {
    std::unique_lock lock(mutex);
    auto id = profiles.Import(path);
    Save();
    return id;
}

std::vector<Profile> ModManager::ListProfiles() const {
    std::shared_lock lock(mutex);
    return profiles.List();
}

Profile ModManager::GetProfile(const std::string& id) const {
    std::shared_lock lock(mutex);
    return profiles.Get(id);
}

std::optional<std::string> ModManager::ActiveProfile() const {
    std::shared_lock lock(mutex);
    return profiles.ActiveProfile();
}

ApplyStats ModManager::ActivateProfile(const std::string& id) {
    return Transition("activate", [&] {
        return profiles.Activate(id);
    });
}

ApplyStats ModManager::SwitchProfile(const std::string& id) {
    return Transition("switch", [&] {
        return profiles.Switch(id);
    });
}

ApplyStats ModManager::DeactivateProfile() {
    return Transition("deactivate", [&] {
        return profiles.Deactivate();
    });
}

std::vector<Conflict> ModManager::GetConflicts(const std::string& id) const {
    std::shared_lock lock(mutex);
    return profiles.Conflicts(id);
}

void ModManager::RestoreVanilla() {
    Transition("restore", [&] {
        // Whatever happens the install no longer runs a profile
        profiles.MarkInactive();
        overlay.RestoreAll();
    });
}

std::vector<std::string> ModManager::VerifyOverlay() const {
    std::shared_lock lock(mutex);
    return overlay.Verify();
}

std::vector<OverlayEntry> ModManager::OverlayEntries() const {
    std::shared_lock lock(mutex);
    std::vector<OverlayEntry> out;
    for (const auto& [path, entry] : overlay.Entries()) out.push_back(entry);
    return out;
}

std::vector<BackupEntry> ModManager::BackupEntries() const {
    std::shared_lock lock(mutex);
    return backups.Entries();
}
