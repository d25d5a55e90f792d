#pragma once
#include "config.h"
#include "grid.h"
#include <cstdint>
#include <map>
#include <vector>

using PayTable = std::map<int, std::vector<std::int64_t>>;

// one removed group; built once per cascade step and never mutated
struct MatchGroup {
    int symbolId = 0;
    std::vector<Position> positions;
    int count = 0;
    std::int64_t payout = 0;
};

// a 1024-ways win: every reel from 0 up to the first reel lacking the symbol
struct LineMatch {
    int symbolId = 0;
    std::vector<Position> positions;
    int length = 0;   // consecutive reels
    int count = 0;    // matching cells over those reels
    std::int64_t payout = 0;
};

constexpr int kMinWaysLength = 3;

// pay table lookup at n (group size or line length), clamped to the last entry
std::int64_t lookupPayout(const PayTable& payTable, int symbolId, int n);

// flood fill of same-id cells plus wilds, groups of at least minMatch
std::vector<MatchGroup> findAdjacencyMatches(const Grid& grid, const AlgorithmConfig& algorithm,
                                             const CascadeConfig& cascade);

// leftmost-anchored ways, at most one match per paying symbol id
std::vector<LineMatch> findWaysMatches(const Grid& grid, const AlgorithmConfig& algorithm);

std::vector<MatchGroup> toMatchGroups(const std::vector<LineMatch>& lines);

// dispatch on cascade.matchMode
std::vector<MatchGroup> findMatches(const Grid& grid, const AlgorithmConfig& algorithm,
                                    const CascadeConfig& cascade);
