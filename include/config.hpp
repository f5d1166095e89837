#pragma once

#include <filesystem>
#include <string>

class Config {
public:
    // Empty means Paths::StateDirectory
    std::string state_root;
    bool debug_mode;
    int io_retries;
    int io_retry_delay_ms;
    bool parallel_apply;
    int apply_threads;

    void Save(const std::filesystem::path& path);
    void Load(const std::filesystem::path& path);
    void Reset();

    static Config* GetInstance();
private:
    Config();
};
