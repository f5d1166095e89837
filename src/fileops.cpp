#include "fileops.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace FileOps {

    std::optional<std::string> NormalizeRelativePath(std::string_view raw) {
        std::string path(raw);
        std::replace(path.begin(), path.end(), '\\', '/');

        if (path.empty() || path.front() == '/') return std::nullopt;
        if (path.size() >= 2 && path[1] == ':') return std::nullopt;
        if (path.find('\0') != std::string::npos) return std::nullopt;

        std::string out;
        size_t pos = 0;
        while (pos <= path.size()) {
            size_t next = path.find('/', pos);
            if (next == std::string::npos) next = path.size();
            std::string segment = path.substr(pos, next - pos);
            pos = next + 1;

            if (segment.empty() || segment == ".") continue;
            if (segment == "..") return std::nullopt;

            if (!out.empty()) out.push_back('/');
            out += segment;
        }

        if (out.empty()) return std::nullopt;
        return out;
    }

    std::vector<char> ReadFile(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw fs::filesystem_error("Failed to open file", path, std::make_error_code(std::errc::io_error));
        }
        return std::vector<char> {
            std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()
        };
    }

    static fs::path TempSibling(const fs::path& path) {
        auto tmp = path;
        tmp += ".modlayer-tmp";
        return tmp;
    }

    void WriteTextAtomic(const fs::path& path, const std::string& text) {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());

        auto tmp = TempSibling(path);
        {
            std::ofstream stream(tmp, std::ios::binary | std::ios::trunc);
            stream.write(text.data(), text.size());
            stream.flush();
            if (!stream) {
                std::error_code ec;
                fs::remove(tmp, ec);
                throw fs::filesystem_error("Failed to write file", tmp, std::make_error_code(std::errc::io_error));
            }
        }
        fs::rename(tmp, path);
    }

    void CopyFileAtomic(const fs::path& src, const fs::path& dst) {
        if (dst.has_parent_path()) fs::create_directories(dst.parent_path());

        auto tmp = TempSibling(dst);
        try {
            fs::copy_file(src, tmp, fs::copy_options::overwrite_existing);
            fs::rename(tmp, dst);
        } catch (const fs::filesystem_error&) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw;
        }
    }

    bool Exists(const fs::path& path) {
        std::error_code ec;
        auto status = fs::symlink_status(path, ec);
        if (status.type() == fs::file_type::not_found) return false;
        if (ec) throw fs::filesystem_error("Failed to stat", path, ec);
        return true;
    }

    bool RemoveFile(const fs::path& path) {
        std::error_code ec;
        auto status = fs::symlink_status(path, ec);
        if (status.type() == fs::file_type::not_found) return false;
        if (ec) throw fs::filesystem_error("Failed to stat", path, ec);
        if (status.type() == fs::file_type::directory) {
            throw fs::filesystem_error("Refusing to remove a directory", path, std::make_error_code(std::errc::is_a_directory));
        }
        return fs::remove(path);
    }

    void PruneEmptyParents(const fs::path& path, const fs::path& stop_at) {
        auto stop = stop_at.lexically_normal();
        if (!stop.has_filename()) stop = stop.parent_path();
        auto dir = path.parent_path().lexically_normal();

        while (!dir.empty() && dir != stop) {
            auto rel = dir.lexically_relative(stop);
            if (rel.empty() || *rel.begin() == "..") break;

            std::error_code ec;
            if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec) || ec) break;
            if (!fs::remove(dir, ec) || ec) break;
            dir = dir.parent_path();
        }
    }

}
