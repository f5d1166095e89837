#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace FileOps {
    struct RetryPolicy {
        int retries = 3;
        int delay_ms = 20;
    };

    // Forward slashes, no "." or empty segments. Empty optional when the path
    // is absolute, has a drive prefix or climbs out with "..".
    std::optional<std::string> NormalizeRelativePath(std::string_view raw);

    std::vector<char> ReadFile(const std::filesystem::path& path);

    // Writes go to a sibling temporary file that is renamed over the target
    void WriteTextAtomic(const std::filesystem::path& path, const std::string& text);
    void CopyFileAtomic(const std::filesystem::path& src, const std::filesystem::path& dst);

    bool Exists(const std::filesystem::path& path);
    bool RemoveFile(const std::filesystem::path& path);

    // Removes empty directories from path's parent up to (excluding) stop_at
    void PruneEmptyParents(const std::filesystem::path& path, const std::filesystem::path& stop_at);

    // Transient failures surface as std::system_error (filesystem_error included)
    template<typename Fn>
    auto WithRetry(const RetryPolicy& policy, Fn&& fn) -> decltype(fn()) {
        for (int attempt = 0;; attempt++) {
            try {
                return fn();
            } catch (const std::system_error&) {
                if (attempt >= policy.retries) throw;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(policy.delay_ms));
        }
    }
}
