#pragma once

#include "model.hpp"

#include <vector>

namespace ConflictDetector {
    // Every path declared by any mod, with its winner and losers.
    // Mods are given lowest priority first; the last declaring mod wins.
    std::vector<Conflict> Analyze(const std::vector<Mod>& ordered);

    // Only contested paths (losers not empty), sorted by path
    std::vector<Conflict> ConflictsFor(const std::vector<Mod>& ordered);

    // Winner per path, with the content the overlay has to write
    ResolvedSet Resolve(const std::vector<Mod>& ordered);
}
