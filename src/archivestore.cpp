#include "archivestore.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "fileops.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <regex>
#include <sys/stat.h>
#include <zip.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
    using ZipArchive = std::unique_ptr<zip_t, decltype(&zip_discard)>;
    using ZipFile = std::unique_ptr<zip_file_t, decltype(&zip_fclose)>;

    const char* METADATA_FILE = "mod.json";
    const char* ICON_FILE = "icon.png";
    const char* FILES_DIR = "Mod/";

    ZipArchive OpenZip(const fs::path& path) {
        int err = 0;
        zip_t* archive = zip_open(path.string().c_str(), ZIP_RDONLY, &err);
        if (archive == nullptr) {
            zip_error_t error;
            zip_error_init_with_code(&error, err);
            std::string msg = std::format("Error opening zip {}: {}", path.string(), zip_error_strerror(&error));
            zip_error_fini(&error);
            throw ModException(ErrorKind::CorruptArchive, msg, { path.string() });
        }
        return ZipArchive(archive, &zip_discard);
    }

    std::string ReadZipEntry(zip_t* archive, uint64_t index) {
        ZipFile file(zip_fopen_index(archive, index, 0), &zip_fclose);
        if (file == nullptr) {
            throw ModException(ErrorKind::CorruptArchive, std::format("Failed to open zip entry {}", index));
        }
        std::string out;
        char buf[1 << 14];
        zip_int64_t n;
        while ((n = zip_fread(file.get(), buf, sizeof(buf))) > 0) {
            out.append(buf, static_cast<size_t>(n));
        }
        if (n < 0) {
            throw ModException(ErrorKind::CorruptArchive, std::format("Failed to read zip entry {}", index));
        }
        return out;
    }

    bool IsZip(const fs::path& path) {
        auto ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
        return ext == ".zip";
    }
}

ArchiveStore::ArchiveStore(fs::path root) : root(std::move(root)) {}

std::string ArchiveStore::MakeId(const std::string& name) {
    std::string out;
    bool last_underscore = false;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            out.push_back(static_cast<char>(std::tolower(uc)));
            last_underscore = false;
        } else if (c == ' ' || c == '-' || c == '_' || c == '.') {
            if (!last_underscore && !out.empty()) out.push_back('_');
            last_underscore = true;
        }
    }
    if (out.size() > 48) out.resize(48);
    while (!out.empty() && out.back() == '_') out.pop_back();
    if (out.empty()) out = "mod";
    return out;
}

std::string ArchiveStore::AssignId(const std::string& name) const {
    auto base = MakeId(name);
    for (int n = 1;; n++) {
        auto id = n == 1 ? base : std::format("{}_{}", base, n);
        auto it = mods.find(id);
        if (it == mods.end() || it->second.name == name) return id;
    }
}

void ArchiveStore::Load() {
    std::unique_lock lock(mutex);
    mods.clear();
    fs::create_directories(root);

    // Finish or undo replacements interrupted by a crash
    std::vector<fs::path> leftovers;
    for (const auto& entry : fs::directory_iterator(root)) {
        if (entry.path().filename().string().starts_with(".")) leftovers.push_back(entry.path());
    }
    for (const auto& path : leftovers) {
        auto name = path.filename().string();
        if (name.starts_with(".staging-")) {
            fs::remove_all(path);
        } else if (name.starts_with(".retired-")) {
            auto live = root / name.substr(9);
            if (fs::exists(live)) {
                fs::remove_all(path);
            } else {
                fs::rename(path, live);
            }
        }
    }

    for (const auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_directory() || entry.path().filename().string().starts_with(".")) continue;
        try {
            auto mod = ReadManifest(entry.path());
            mods.emplace(mod.id, std::move(mod));
        } catch (const std::exception& ex) {
            Log::Warning("ArchiveStore::Load", "Skipping {} ({})", entry.path().string(), ex.what());
        }
    }
    Log::Debug("ArchiveStore::Load", "Loaded {} mods from {}", mods.size(), root.string());
}

ArchiveStore::Payload ArchiveStore::ScanDirectory(const fs::path& payload) {
    Payload result;
    result.fallback_name = payload.filename().string();

    std::vector<std::string> rejected;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(payload)) {
            auto rel = entry.path().lexically_relative(payload).generic_string();
            if (entry.is_symlink()) {
                rejected.push_back(rel);
            } else if (entry.is_regular_file()) {
                auto normalized = FileOps::NormalizeRelativePath(rel);
                if (!normalized) {
                    rejected.push_back(rel);
                } else {
                    result.entries.push_back(PayloadEntry { .rel = *normalized, .source = entry.path() });
                }
            } else if (!entry.is_directory()) {
                rejected.push_back(rel);
            }
        }
    } catch (const fs::filesystem_error& ex) {
        throw ModException(ErrorKind::CorruptArchive, std::format("Unreadable payload: {}", ex.what()), { payload.string() });
    }

    if (!rejected.empty()) {
        throw ModException(ErrorKind::CorruptArchive, std::format("{} contains unsafe entries", payload.string()), rejected);
    }

    if (auto metadata = payload / METADATA_FILE; fs::is_regular_file(metadata)) {
        auto bytes = FileOps::ReadFile(metadata);
        result.metadata.assign(bytes.begin(), bytes.end());
    }
    return result;
}

ArchiveStore::Payload ArchiveStore::ScanZip(const fs::path& payload) {
    Payload result;
    result.is_zip = true;
    result.fallback_name = payload.stem().string();

    auto archive = OpenZip(payload);
    std::vector<std::string> rejected;

    zip_int64_t num_entries = zip_get_num_entries(archive.get(), 0);
    if (num_entries < 0) {
        throw ModException(ErrorKind::CorruptArchive, std::format("Failed to list {}", payload.string()), { payload.string() });
    }

    for (zip_int64_t i = 0; i < num_entries; i++) {
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(archive.get(), i, 0, &stat) != 0 || stat.name == nullptr) {
            throw ModException(ErrorKind::CorruptArchive, std::format("Failed to stat entry {} of {}", i, payload.string()), { payload.string() });
        }

        std::string name(stat.name);
        if (name.ends_with("/")) {
            if (!FileOps::NormalizeRelativePath(name)) rejected.push_back(name);
            continue;
        }

        zip_uint8_t opsys = 0;
        zip_uint32_t attributes = 0;
        if (zip_file_get_external_attributes(archive.get(), i, 0, &opsys, &attributes) == 0
            && opsys == ZIP_OPSYS_UNIX && ((attributes >> 16) & S_IFMT) == S_IFLNK) {
            rejected.push_back(name);
            continue;
        }

        auto normalized = FileOps::NormalizeRelativePath(name);
        if (!normalized) {
            rejected.push_back(name);
            continue;
        }
        result.entries.push_back(PayloadEntry { .rel = *normalized, .zip_index = static_cast<uint64_t>(i) });
    }

    if (!rejected.empty()) {
        throw ModException(ErrorKind::CorruptArchive, std::format("{} contains unsafe entries", payload.string()), rejected);
    }

    // Archives often wrap everything in a single top-level folder
    auto has_root_layout = std::any_of(result.entries.begin(), result.entries.end(), [](const PayloadEntry& e) {
        return e.rel == METADATA_FILE || e.rel.starts_with(FILES_DIR);
    });
    if (!has_root_layout && !result.entries.empty()) {
        auto first = result.entries.front().rel;
        auto slash = first.find('/');
        if (slash != std::string::npos) {
            auto prefix = first.substr(0, slash + 1);
            bool shared = std::all_of(result.entries.begin(), result.entries.end(), [&](const PayloadEntry& e) {
                return e.rel.starts_with(prefix);
            });
            if (shared) {
                for (auto& e : result.entries) e.rel = e.rel.substr(prefix.size());
            }
        }
    }

    for (const auto& e : result.entries) {
        if (e.rel == METADATA_FILE) {
            result.metadata = ReadZipEntry(archive.get(), e.zip_index);
            break;
        }
    }
    return result;
}

void ArchiveStore::ApplyMetadata(Mod& mod, const std::string& metadata) {
    if (metadata.empty()) return;

    json j = json::parse(metadata, nullptr, false, true);
    if (j.is_discarded()) {
        // Hand-edited mod.json files commonly carry trailing commas
        static const std::regex trailing_comma(",\\s*([}\\]])");
        j = json::parse(std::regex_replace(metadata, trailing_comma, "$1"), nullptr, false, true);
    }
    if (!j.is_object()) {
        Log::Warning("ArchiveStore::ApplyMetadata", "Ignoring unparsable mod.json for {}", mod.name);
        return;
    }

    auto text = [&](const char* key, std::string& field) {
        if (auto it = j.find(key); it != j.end() && it->is_string() && !it->get<std::string>().empty()) {
            field = it->get<std::string>();
        }
    };
    text("name", mod.name);
    text("description", mod.description);
    text("version", mod.version);
    text("author", mod.author);
    text("game", mod.game);
    text("category", mod.category);
}

void ArchiveStore::ExtractZip(const fs::path& payload, const std::vector<PayloadEntry>& entries, const fs::path& out) {
    auto archive = OpenZip(payload);
    std::vector<char> buf(1 << 16);

    for (const auto& entry : entries) {
        ZipFile file(zip_fopen_index(archive.get(), entry.zip_index, 0), &zip_fclose);
        if (file == nullptr) {
            throw ModException(ErrorKind::CorruptArchive, std::format("Failed to open {} in {}", entry.rel, payload.string()), { entry.rel });
        }

        auto target = out / entry.rel;
        fs::create_directories(target.parent_path());
        std::ofstream stream(target, std::ios::binary | std::ios::trunc);
        if (!stream) {
            throw fs::filesystem_error("Failed to create", target, std::make_error_code(std::errc::io_error));
        }

        zip_int64_t n;
        while ((n = zip_fread(file.get(), buf.data(), buf.size())) > 0) {
            stream.write(buf.data(), n);
        }
        if (n < 0) {
            throw ModException(ErrorKind::CorruptArchive, std::format("Failed to read {} in {}", entry.rel, payload.string()), { entry.rel });
        }
        if (!stream.flush()) {
            throw fs::filesystem_error("Failed to write", target, std::make_error_code(std::errc::io_error));
        }
    }
}

std::string ArchiveStore::Register(const fs::path& payload) {
    Payload scanned;
    if (fs::is_directory(payload)) {
        scanned = ScanDirectory(payload);
    } else if (fs::is_regular_file(payload) && IsZip(payload)) {
        scanned = ScanZip(payload);
    } else {
        throw ModException(ErrorKind::CorruptArchive, std::format("{} is neither a mod folder nor a zip archive", payload.string()), { payload.string() });
    }

    // Only Mod/ is overlaid when present; metadata never is
    bool has_files_dir = std::any_of(scanned.entries.begin(), scanned.entries.end(), [](const PayloadEntry& e) {
        return e.rel.starts_with(FILES_DIR);
    });
    std::vector<PayloadEntry> files;
    for (auto& e : scanned.entries) {
        if (has_files_dir) {
            if (!e.rel.starts_with(FILES_DIR)) continue;
            e.rel = e.rel.substr(std::string(FILES_DIR).size());
        } else if (e.rel == METADATA_FILE || e.rel == ICON_FILE) {
            continue;
        }
        files.push_back(e);
    }
    if (files.empty()) {
        throw ModException(ErrorKind::CorruptArchive, std::format("{} contains no files", payload.string()), { payload.string() });
    }
    std::sort(files.begin(), files.end(), [](const PayloadEntry& a, const PayloadEntry& b) { return a.rel < b.rel; });

    Mod mod;
    mod.name = scanned.fallback_name;
    ApplyMetadata(mod, scanned.metadata);
    mod.installed_at = UnixNow();

    std::unique_lock lock(mutex);
    mod.id = AssignId(mod.name);
    fs::create_directories(root);
    auto staging = root / (".staging-" + mod.id);
    auto retired = root / (".retired-" + mod.id);
    auto live = root / mod.id;
    fs::remove_all(staging);

    try {
        auto files_dir = staging / "files";
        if (scanned.is_zip) {
            ExtractZip(payload, files, files_dir);
        } else {
            for (const auto& e : files) {
                auto target = files_dir / e.rel;
                fs::create_directories(target.parent_path());
                try {
                    fs::copy_file(e.source, target, fs::copy_options::overwrite_existing);
                } catch (const fs::filesystem_error& ex) {
                    throw ModException(ErrorKind::CorruptArchive, std::format("Failed to read {}: {}", e.rel, ex.what()), { e.rel });
                }
            }
        }

        for (const auto& e : files) {
            auto stored = files_dir / e.rel;
            mod.files.push_back(ModFile {
                .path = e.rel,
                .sha256 = Crypto::ComputeFileSHA256(stored),
                .size = static_cast<uint64_t>(fs::file_size(stored))
            });
        }
        WriteManifest(mod, staging);

        fs::remove_all(retired);
        if (fs::exists(live)) fs::rename(live, retired);
        fs::rename(staging, live);
        fs::remove_all(retired);
    } catch (...) {
        std::error_code ec;
        fs::remove_all(staging, ec);
        throw;
    }

    mod.payload_dir = live / "files";
    bool replaced = mods.contains(mod.id);
    mods[mod.id] = mod;

    Log::Info("ArchiveStore::Register", "{} mod {} ({} files)", replaced ? "Updated" : "Registered", mod.id, mod.files.size());
    return mod.id;
}

Mod ArchiveStore::Get(const std::string& id) const {
    std::shared_lock lock(mutex);
    auto it = mods.find(id);
    if (it == mods.end()) {
        throw ModException(ErrorKind::NotFound, std::format("Mod {} is not registered", id), { id });
    }
    return it->second;
}

bool ArchiveStore::Contains(const std::string& id) const {
    std::shared_lock lock(mutex);
    return mods.contains(id);
}

std::vector<Mod> ArchiveStore::List() const {
    std::shared_lock lock(mutex);
    std::vector<Mod> out;
    out.reserve(mods.size());
    for (const auto& [id, mod] : mods) out.push_back(mod);
    return out;
}

std::vector<Mod> ArchiveStore::Resolve(const std::vector<std::string>& ids) const {
    std::shared_lock lock(mutex);
    std::vector<Mod> out;
    std::vector<std::string> missing;
    for (const auto& id : ids) {
        auto it = mods.find(id);
        if (it == mods.end()) {
            missing.push_back(id);
        } else {
            out.push_back(it->second);
        }
    }
    if (!missing.empty()) {
        throw ModException(ErrorKind::DanglingModReference, std::format("{} referenced mod(s) are not registered", missing.size()), missing);
    }
    return out;
}

void ArchiveStore::Remove(const std::string& id, const std::function<bool(const std::string&)>& in_use) {
    std::unique_lock lock(mutex);
    if (!mods.contains(id)) {
        throw ModException(ErrorKind::NotFound, std::format("Mod {} is not registered", id), { id });
    }
    if (in_use && in_use(id)) {
        throw ModException(ErrorKind::InUse, std::format("Mod {} is referenced by the active profile", id), { id });
    }

    fs::remove_all(root / id);
    mods.erase(id);
    Log::Info("ArchiveStore::Remove", "Removed mod {}", id);
}

Mod ArchiveStore::ReadManifest(const fs::path& mod_dir) {
    std::ifstream stream(mod_dir / "manifest.json");
    json j = json::parse(stream);

    Mod mod;
    mod.id = j.at("id").get<std::string>();
    mod.name = j.at("name").get<std::string>();
    mod.description = j.value("description", "");
    mod.version = j.value("version", mod.version);
    mod.author = j.value("author", mod.author);
    mod.game = j.value("game", "");
    mod.category = j.value("category", mod.category);
    mod.installed_at = j.value("installed_at", 0LL);
    mod.payload_dir = mod_dir / "files";

    for (const auto& f : j.at("files")) {
        mod.files.push_back(ModFile {
            .path = f.at("path").get<std::string>(),
            .sha256 = f.at("sha256").get<std::string>(),
            .size = f.value("size", uint64_t { 0 })
        });
    }
    std::sort(mod.files.begin(), mod.files.end(), [](const ModFile& a, const ModFile& b) { return a.path < b.path; });

    if (mod.id != mod_dir.filename().string()) {
        throw std::runtime_error(std::format("manifest id {} does not match its folder", mod.id));
    }
    return mod;
}

void ArchiveStore::WriteManifest(const Mod& mod, const fs::path& mod_dir) {
    json files = json::array();
    for (const auto& f : mod.files) {
        files.push_back({ { "path", f.path }, { "sha256", f.sha256 }, { "size", f.size } });
    }

    json j = {
        { "id", mod.id },
        { "name", mod.name },
        { "description", mod.description },
        { "version", mod.version },
        { "author", mod.author },
        { "game", mod.game },
        { "category", mod.category },
        { "installed_at", mod.installed_at },
        { "files", files }
    };
    FileOps::WriteTextAtomic(mod_dir / "manifest.json", j.dump(4));
}
