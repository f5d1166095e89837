#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "modmanager.hpp"
#include "paths.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    struct Arguments {
        std::string game_id;
        std::filesystem::path root;
        std::filesystem::path state_dir;
        bool verbose = false;
        std::string command;
        std::vector<std::string> rest;
    };

    const std::vector<std::string> COMMANDS = {
        "register", "mods", "remove-mod",
        "profile-create", "profiles", "profile-set", "profile-enable", "profile-disable",
        "profile-rename", "profile-duplicate", "profile-delete", "profile-export", "profile-import",
        "conflicts", "activate", "deactivate", "restore", "verify"
    };

    void PrintUsage() {
        std::cout
            << "usage: modlayer --game <id> --root <dir> [--state <dir>] [--verbose] <command> [args]\n"
            << "\n"
            << "commands:\n"
            << "  register <folder|zip>                 register or update a mod\n"
            << "  mods                                  list registered mods\n"
            << "  remove-mod <mod>\n"
            << "  profile-create <name>\n"
            << "  profiles                              list profiles (* marks the active one)\n"
            << "  profile-set <profile> [mod...]        replace the load order, lowest priority first\n"
            << "  profile-enable <profile> <mod> [pos]\n"
            << "  profile-disable <profile> <mod>\n"
            << "  profile-rename <profile> <name>\n"
            << "  profile-duplicate <profile> [name]\n"
            << "  profile-delete <profile>\n"
            << "  profile-export <profile> <file>\n"
            << "  profile-import <file>\n"
            << "  conflicts <profile>\n"
            << "  activate <profile>\n"
            << "  deactivate\n"
            << "  restore                               put every original file back\n"
            << "  verify                                report overlaid files that changed on disk\n";
    }

    std::optional<Arguments> ParseArguments(int argc, char** argv) {
        Arguments args;
        int i = 1;
        for (; i < argc; i++) {
            std::string arg = argv[i];
            if (!arg.starts_with("--")) break;

            if (arg == "--verbose") {
                args.verbose = true;
                continue;
            }
            if (i + 1 >= argc) {
                std::cerr << std::format("Missing value for {}", arg) << std::endl;
                return std::nullopt;
            }
            if (arg == "--game") {
                args.game_id = argv[++i];
            } else if (arg == "--root") {
                args.root = argv[++i];
            } else if (arg == "--state") {
                args.state_dir = argv[++i];
            } else {
                std::cerr << std::format("Unknown option {}", arg) << std::endl;
                return std::nullopt;
            }
        }

        if (i >= argc || args.game_id.empty() || args.root.empty()) return std::nullopt;

        args.command = argv[i++];
        std::transform(args.command.begin(), args.command.end(), args.command.begin(), [](unsigned char c) {
            return std::tolower(c);
        });
        for (; i < argc; i++) {
            args.rest.push_back(argv[i]);
        }
        return args;
    }

    void Require(const Arguments& args, size_t count) {
        if (args.rest.size() < count) {
            throw std::invalid_argument(std::format("{} expects at least {} argument(s)", args.command, count));
        }
    }

    void PrintStats(const char* what, const ApplyStats& stats) {
        std::cout << std::format("{}: {} written, {} restored, {} unchanged", what, stats.written, stats.restored, stats.unchanged) << std::endl;
    }

    // Exit status of the command
    int RunCommand(ModManager& manager, const Arguments& args) {
        const auto& command = args.command;

        if (command == "register") {
            Require(args, 1);
            auto id = manager.RegisterMod(args.rest[0]);
            std::cout << id << std::endl;
        } else if (command == "mods") {
            for (const auto& mod : manager.ListMods()) {
                std::cout << std::format("{}\t{}\t{}\t{}\t{} files", mod.id, mod.name, mod.version, mod.author, mod.file_count) << std::endl;
            }
        } else if (command == "remove-mod") {
            Require(args, 1);
            manager.RemoveMod(args.rest[0]);
        } else if (command == "profile-create") {
            Require(args, 1);
            std::cout << manager.CreateProfile(args.rest[0]) << std::endl;
        } else if (command == "profiles") {
            auto active = manager.ActiveProfile();
            for (const auto& profile : manager.ListProfiles()) {
                std::string mods;
                for (const auto& mod : profile.mods) {
                    mods += mods.empty() ? mod : ", " + mod;
                }
                std::cout << std::format("{} {}\t{}\t[{}]", active == profile.id ? "*" : " ", profile.id, profile.name, mods) << std::endl;
            }
        } else if (command == "profile-set") {
            Require(args, 1);
            manager.ReorderProfile(args.rest[0], std::vector<std::string>(args.rest.begin() + 1, args.rest.end()));
        } else if (command == "profile-enable") {
            Require(args, 2);
            std::optional<size_t> position;
            if (args.rest.size() > 2) position = std::stoul(args.rest[2]);
            manager.EnableMod(args.rest[0], args.rest[1], position);
        } else if (command == "profile-disable") {
            Require(args, 2);
            manager.DisableMod(args.rest[0], args.rest[1]);
        } else if (command == "profile-rename") {
            Require(args, 2);
            manager.RenameProfile(args.rest[0], args.rest[1]);
        } else if (command == "profile-duplicate") {
            Require(args, 1);
            std::optional<std::string> name;
            if (args.rest.size() > 1) name = args.rest[1];
            std::cout << manager.DuplicateProfile(args.rest[0], name) << std::endl;
        } else if (command == "profile-delete") {
            Require(args, 1);
            manager.DeleteProfile(args.rest[0]);
        } else if (command == "profile-export") {
            Require(args, 2);
            manager.ExportProfile(args.rest[0], args.rest[1]);
        } else if (command == "profile-import") {
            Require(args, 1);
            std::cout << manager.ImportProfile(args.rest[0]) << std::endl;
        } else if (command == "conflicts") {
            Require(args, 1);
            auto conflicts = manager.GetConflicts(args.rest[0]);
            for (const auto& conflict : conflicts) {
                std::string losers;
                for (const auto& loser : conflict.losers) {
                    losers += losers.empty() ? loser : ", " + loser;
                }
                std::cout << std::format("{}\twinner: {}\toverrides: {}", conflict.path, conflict.winner, losers) << std::endl;
            }
            if (conflicts.empty()) std::cout << "No conflicts" << std::endl;
        } else if (command == "activate") {
            Require(args, 1);
            auto stats = manager.ActiveProfile() ? manager.SwitchProfile(args.rest[0]) : manager.ActivateProfile(args.rest[0]);
            PrintStats("Activated", stats);
        } else if (command == "deactivate") {
            PrintStats("Deactivated", manager.DeactivateProfile());
        } else if (command == "restore") {
            manager.RestoreVanilla();
            std::cout << "Game files restored" << std::endl;
        } else if (command == "verify") {
            auto drifted = manager.VerifyOverlay();
            for (const auto& path : drifted) {
                std::cout << path << std::endl;
            }
            std::cout << std::format("{} overlaid file(s) changed on disk", drifted.size()) << std::endl;
            return drifted.empty() ? 0 : 3;
        }
        return 0;
    }
}

int main(int argc, char** argv) {
    // Ensure paths are set and directories are created
    try {
        Paths::InitPaths();
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        return 1;
    }

    // Load config
    auto config = Config::GetInstance();
    if (std::filesystem::exists(Paths::ConfigFile)) {
        config->Load(Paths::ConfigFile);
    }

    auto args = ParseArguments(argc, argv);
    if (!args) {
        PrintUsage();
        return 2;
    }
    if (std::find(COMMANDS.begin(), COMMANDS.end(), args->command) == COMMANDS.end()) {
        std::cerr << std::format("Unknown command {}", args->command) << std::endl;
        PrintUsage();
        return 2;
    }

    // Setup log
    Log::OpenLogFile(Paths::LogFile);
    Log::SetQuiet(!args->verbose && !config->debug_mode);
    if (config->debug_mode || args->verbose) {
        Log::SetLevel(Log::LEVEL_DEBUG);
        Log::Info("MAIN", "Started in debug mode");
    } else {
        Log::SetLevel(Log::LEVEL_ERROR);
    }

    int status = 0;
    try {
        ModManager manager(ModManager::MakeInstall(args->game_id, args->root, args->state_dir));
        status = RunCommand(manager, *args);
    } catch (const ModException& ex) {
        std::cerr << ex.what() << std::endl;
        for (const auto& subject : ex.subjects) {
            std::cerr << "  " << subject << std::endl;
        }
        if (ex.kind == ErrorKind::UnrecoverableState) {
            std::cerr << "\n"
                      << "!!! The game directory is in an inconsistent state. !!!\n"
                      << std::format("!!! Run `modlayer --game {} --root {} restore` to put the original files back. !!!", args->game_id, args->root.string())
                      << std::endl;
        }
        Log::Error("MAIN", "{}", ex.what());
        status = 1;
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        Log::Error("MAIN", "{}", ex.what());
        status = 1;
    }

    // Fills in defaults for keys missing from the file
    try {
        config->Save(Paths::ConfigFile);
    } catch (const std::exception& ex) {
        Log::Error("MAIN", "Failed to save config ({})", ex.what());
    }
    Log::FreeLogFile();
    return status;
}
