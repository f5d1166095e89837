#include "paths.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

std::filesystem::path Paths::RootDirectory;
std::filesystem::path Paths::StateDirectory;
std::filesystem::path Paths::LogFile;
std::filesystem::path Paths::ConfigFile;

void Paths::InitPaths() {
    std::filesystem::path data_home;

    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg != nullptr && *xdg != '\0') {
        data_home = xdg;
    } else if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        data_home = std::filesystem::path(home) / ".local" / "share";
    } else {
        throw std::runtime_error("Failed to find a data directory (neither XDG_DATA_HOME nor HOME is set)");
    }

    RootDirectory = data_home / "modlayer";
    StateDirectory = RootDirectory / "installs";
    LogFile = RootDirectory / "latest.log";
    ConfigFile = RootDirectory / "config.json";

    // Create directories
    std::filesystem::create_directories(RootDirectory);
    std::filesystem::create_directories(StateDirectory);
}
