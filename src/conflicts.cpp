#include "conflicts.hpp"
#include "log.hpp"

#include <algorithm>
#include <map>

namespace ConflictDetector {

    std::vector<Conflict> Analyze(const std::vector<Mod>& ordered) {
        std::map<std::string, std::vector<std::string>> declared;
        for (const auto& mod : ordered) {
            for (const auto& file : mod.files) {
                auto& owners = declared[file.path];
                // A mod listed twice only counts at its last position
                std::erase(owners, mod.id);
                owners.push_back(mod.id);
            }
        }

        std::vector<Conflict> out;
        out.reserve(declared.size());
        for (auto& [path, owners] : declared) {
            Conflict c;
            c.path = path;
            c.winner = owners.back();
            owners.pop_back();
            c.losers = std::move(owners);
            out.push_back(std::move(c));
        }
        return out;
    }

    std::vector<Conflict> ConflictsFor(const std::vector<Mod>& ordered) {
        auto all = Analyze(ordered);
        std::erase_if(all, [](const Conflict& c) { return c.losers.empty(); });
        Log::Debug("ConflictDetector::ConflictsFor", "{} contested paths across {} mods", all.size(), ordered.size());
        return all;
    }

    ResolvedSet Resolve(const std::vector<Mod>& ordered) {
        ResolvedSet resolved;
        for (const auto& mod : ordered) {
            for (const auto& file : mod.files) {
                resolved[file.path] = ResolvedFile {
                    .mod_id = mod.id,
                    .sha256 = file.sha256,
                    .source = mod.SourceOf(file.path)
                };
            }
        }
        return resolved;
    }

}
