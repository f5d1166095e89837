#include "manifest.hpp"
#include "fileops.hpp"
#include "log.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Manifest {

    std::optional<ManifestData> Load(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) return std::nullopt;

        try {
            std::ifstream stream(path);
            json j = json::parse(stream);

            if (j.value("version", 0) != ManifestData::VERSION) {
                Log::Warning("Manifest::Load", "Unsupported manifest version in {}", path.string());
                return std::nullopt;
            }

            ManifestData data;
            data.game_id = j.value("game_id", "");
            data.root = j.value("root", "");

            for (const auto& p : j.at("profiles")) {
                data.profiles.push_back(Profile {
                    .id = p.at("id").get<std::string>(),
                    .name = p.at("name").get<std::string>(),
                    .mods = p.at("mods").get<std::vector<std::string>>(),
                    .last_modified = p.value("last_modified", 0LL)
                });
            }

            if (auto active = j.find("active_profile"); active != j.end() && active->is_string()) {
                data.active_profile = active->get<std::string>();
            }

            for (const auto& o : j.at("overlay")) {
                OverlayEntry entry {
                    .path = o.at("path").get<std::string>(),
                    .mod_id = o.at("mod").get<std::string>(),
                    .sha256 = o.at("sha256").get<std::string>(),
                    .backup_ref = o.value("backup", "")
                };
                data.overlay.emplace(entry.path, entry);
            }

            // Mods and backups are informational here; the loaders read them from disk
            for (const auto& m : j.value("mods", json::array())) {
                Mod mod;
                mod.id = m.at("id").get<std::string>();
                mod.name = m.value("name", mod.id);
                for (const auto& f : m.at("files")) {
                    mod.files.push_back(ModFile { .path = f.at("path").get<std::string>(), .sha256 = f.at("sha256").get<std::string>() });
                }
                data.mods.push_back(std::move(mod));
            }
            for (const auto& b : j.value("backups", json::array())) {
                data.backups.push_back(BackupEntry {
                    .path = b.at("path").get<std::string>(),
                    .existed = b.at("existed").get<bool>(),
                    .sha256 = b.value("sha256", ""),
                    .blob = b.value("blob", "")
                });
            }
            return data;
        } catch (const std::exception& ex) {
            Log::Error("Manifest::Load", "Failed to read {} ({})", path.string(), ex.what());
            return std::nullopt;
        }
    }

    void Save(const std::filesystem::path& path, const ManifestData& data) {
        json mods = json::array();
        for (const auto& mod : data.mods) {
            json files = json::array();
            for (const auto& f : mod.files) {
                files.push_back({ { "path", f.path }, { "sha256", f.sha256 } });
            }
            mods.push_back({ { "id", mod.id }, { "name", mod.name }, { "files", files } });
        }

        json profiles = json::array();
        for (const auto& p : data.profiles) {
            profiles.push_back({
                { "id", p.id },
                { "name", p.name },
                { "mods", p.mods },
                { "last_modified", p.last_modified }
            });
        }

        json overlay = json::array();
        for (const auto& [path, entry] : data.overlay) {
            overlay.push_back({
                { "path", entry.path },
                { "mod", entry.mod_id },
                { "sha256", entry.sha256 },
                { "backup", entry.backup_ref }
            });
        }

        json backups = json::array();
        for (const auto& b : data.backups) {
            backups.push_back({
                { "path", b.path },
                { "existed", b.existed },
                { "sha256", b.sha256 },
                { "blob", b.blob }
            });
        }

        json j = {
            { "version", ManifestData::VERSION },
            { "game_id", data.game_id },
            { "root", data.root },
            { "mods", mods },
            { "profiles", profiles },
            { "active_profile", data.active_profile ? json(*data.active_profile) : json(nullptr) },
            { "overlay", overlay },
            { "backups", backups }
        };
        FileOps::WriteTextAtomic(path, j.dump(4));
    }

}
