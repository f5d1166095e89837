/**
 * @file TestHelpers.hpp
 * @brief Temporary game installs, mod folders and file comparison helpers
 */

#pragma once

#include <gtest/gtest.h>

#include "crypto.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <vector>
#include <string>

namespace ModlayerTest {

namespace fs = std::filesystem;

using FileMap = std::map<std::string, std::string>;

// =============================================================================
// File Helpers
// =============================================================================

inline void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream << content;
}

inline std::string ReadText(const fs::path& path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

/**
 * @brief Every regular file below dir keyed by its relative path
 */
inline FileMap Snapshot(const fs::path& dir) {
    FileMap out;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            out[entry.path().lexically_relative(dir).generic_string()] = ReadText(entry.path());
        }
    }
    return out;
}

/**
 * @brief Every directory below dir, so pruning can be checked too
 */
inline std::vector<std::string> Directories(const fs::path& dir) {
    std::vector<std::string> out;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_directory()) out.push_back(entry.path().lexically_relative(dir).generic_string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

inline std::string Sha(const std::string& content) {
    return Crypto::ComputeSHA256(std::vector<char>(content.begin(), content.end()));
}

// =============================================================================
// Temporary Directory Fixture
// =============================================================================

/**
 * @brief Gives each test a private scratch area with a game/, a state/ and a
 * payloads/ directory. Everything is removed on teardown.
 */
class TempDirTest : public ::testing::Test {
protected:
    fs::path base;
    fs::path game;
    fs::path state;
    fs::path payloads;

    void SetUp() override {
        base = fs::temp_directory_path() / ("modlayer-test-" + Crypto::RandomHex(6));
        game = base / "game";
        state = base / "state";
        payloads = base / "payloads";
        fs::create_directories(game);
        fs::create_directories(state);
        fs::create_directories(payloads);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    void WriteGameFile(const std::string& rel, const std::string& content) {
        WriteFile(game / rel, content);
    }

    std::string ReadGameFile(const std::string& rel) const {
        return ReadText(game / rel);
    }

    /**
     * @brief Lays out a mod folder under payloads/ and returns its path.
     * Pass metadata to also drop a mod.json next to the files.
     */
    fs::path MakeModFolder(const std::string& name, const FileMap& files, const std::string& metadata = "") {
        auto dir = payloads / name;
        for (const auto& [rel, content] : files) {
            WriteFile(dir / rel, content);
        }
        if (!metadata.empty()) {
            WriteFile(dir / "mod.json", metadata);
        }
        return dir;
    }
};

} // namespace ModlayerTest
