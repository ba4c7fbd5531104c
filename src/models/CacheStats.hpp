#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstddef>
#include <cstdint>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t sets = 0;
    std::uint64_t skipped_sets = 0;
    std::uint64_t removals = 0;
    std::uint64_t pattern_removals = 0;
    std::uint64_t invalidations = 0;
    std::uint64_t type_mismatches = 0;
    std::size_t evictions = 0;
    std::size_t entries = 0;
};

inline void to_json(json& j, const CacheStats& stats) {
    j = json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"sets", stats.sets},
        {"skipped_sets", stats.skipped_sets},
        {"removals", stats.removals},
        {"pattern_removals", stats.pattern_removals},
        {"invalidations", stats.invalidations},
        {"type_mismatches", stats.type_mismatches},
        {"evictions", stats.evictions},
        {"entries", stats.entries}
    };
}

#endif // CACHESTATS_HPP
