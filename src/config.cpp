#include "config.hpp"
#include "fileops.hpp"
#include "log.hpp"
#include <algorithm>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

Config::Config() {
    Reset();
}

Config* Config::GetInstance() {
    static Config config;
    return &config;
}

void Config::Reset() {
    this->state_root = "";
    this->debug_mode = false;
    this->io_retries = 3;
    this->io_retry_delay_ms = 20;
    this->parallel_apply = false;
    this->apply_threads = 4;
}

void Config::Load(const std::filesystem::path& path) {
    try {
        std::ifstream stream(path);
        json j = json::parse(stream);

        this->state_root = j.value("state_root", this->state_root);
        this->debug_mode = j.value("debug_mode", this->debug_mode);
        this->io_retries = std::max(0, j.value("io_retries", this->io_retries));
        this->io_retry_delay_ms = std::max(0, j.value("io_retry_delay_ms", this->io_retry_delay_ms));
        this->parallel_apply = j.value("parallel_apply", this->parallel_apply);
        this->apply_threads = std::clamp(j.value("apply_threads", this->apply_threads), 1, 64);
    } catch (const std::exception& ex) {
        Log::Error("Config::Load", "Failed to load config. Using defaults ({})", ex.what());
    }
}

void Config::Save(const std::filesystem::path& path) {
    json j;
    j["state_root"] = this->state_root;
    j["debug_mode"] = this->debug_mode;
    j["io_retries"] = this->io_retries;
    j["io_retry_delay_ms"] = this->io_retry_delay_ms;
    j["parallel_apply"] = this->parallel_apply;
    j["apply_threads"] = this->apply_threads;

    FileOps::WriteTextAtomic(path, j.dump(4));
}
