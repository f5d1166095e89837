#include "model.hpp"
#include <algorithm>
#include <chrono>

const ModFile* Mod::Find(const std::string& path) const {
    auto it = std::lower_bound(files.begin(), files.end(), path, [](const ModFile& f, const std::string& p) {
        return f.path < p;
    });
    if (it == files.end() || it->path != path) return nullptr;
    return &*it;
}

long long UnixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}
