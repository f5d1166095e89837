#include "log.hpp"
#include <chrono>
#include <iostream>
#include <memory>

std::unique_ptr<std::ofstream> Log::log_file = nullptr;
int Log::log_level = Log::LEVEL_ERROR;
bool Log::quiet = false;
std::mutex Log::mutex;

void Log::SetQuiet(bool q) {
    quiet = q;
}

void Log::OpenLogFile(const std::filesystem::path& path) {
    std::lock_guard lock(mutex);
    log_file = std::make_unique<std::ofstream>(path, std::ios::app);
}

void Log::FreeLogFile() {
    std::lock_guard lock(mutex);
    if (log_file == nullptr) return;
    log_file->flush();
    log_file->close();
    log_file = nullptr;
}

void Log::Println(const char* mode, const char* ident, const std::string& msg) {
    std::string formatted_time = std::format("{:%T}", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
    std::string line = std::format("[{}] [{}] [{}] {}", formatted_time, ident, mode, msg);

    // Apply workers log concurrently
    std::lock_guard lock(mutex);
    if (!quiet) {
        std::cout << line << "\n";
    }
    if (log_file != nullptr) {
        *log_file << line << std::endl;
    }
}
