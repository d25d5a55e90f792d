#include "matching.h"
#include <algorithm>
#include <array>
#include <utility>

// up, down, left, right, then the diagonals
constexpr std::array<std::pair<int, int>, 8> kDirections = {{
    {-1, 0}, {1, 0}, {0, -1}, {0, 1},
    {-1, -1}, {-1, 1}, {1, -1}, {1, 1},
}};

static bool isPayingSymbol(const Cell& cell, const AlgorithmConfig& algorithm) {
    return cell.isSymbol() && isOrdinarySymbol(algorithm, cell.symbol);
}

// a wild-seeded group pays as its first ordinary neighbour, or symbol 0
static int effectiveSymbolForWild(const Grid& grid, const AlgorithmConfig& algorithm, int row, int reel) {
    for (int d = 0; d < 4; d++) {
        int r = row + kDirections[d].first;
        int c = reel + kDirections[d].second;
        if (!grid.inBounds(r, c)) continue;
        const Cell& neighbour = grid.at(r, c);
        if (isPayingSymbol(neighbour, algorithm)) return neighbour.symbol;
    }
    return 0;
}

std::int64_t lookupPayout(const PayTable& payTable, int symbolId, int n) {
    auto it = payTable.find(symbolId);
    if (it == payTable.end() || it->second.empty() || n < 1) return 0;
    const auto& row = it->second;
    size_t idx = std::min(static_cast<size_t>(n), row.size()) - 1;
    return row[idx];
}

std::vector<MatchGroup> findAdjacencyMatches(const Grid& grid, const AlgorithmConfig& algorithm,
                                             const CascadeConfig& cascade) {
    const int height = grid.getHeight();
    const int width = grid.getWidth();
    const int directions = cascade.adjacentOnly ? 4 : 8;
    std::vector<std::vector<bool>> visited(height, std::vector<bool>(width, false));
    std::vector<MatchGroup> groups;

    // row-major scan, depth-first fill from every unvisited seed
    for (int row = 0; row < height; row++) {
        for (int reel = 0; reel < width; reel++) {
            if (visited[row][reel]) continue;
            const Cell& seed = grid.at(row, reel);
            if (!seed.isWild() && !isPayingSymbol(seed, algorithm)) continue;

            auto compatible = [&](const Cell& cell) {
                if (cell.isWild()) return true;
                return !seed.isWild() && cell.isSymbol() && cell.symbol == seed.symbol;
            };

            std::vector<Position> positions;
            std::vector<Position> stack = {Position{row, reel}};
            visited[row][reel] = true;
            while (!stack.empty()) {
                Position p = stack.back();
                stack.pop_back();
                positions.push_back(p);
                for (int d = 0; d < directions; d++) {
                    int r = p.row + kDirections[d].first;
                    int c = p.reel + kDirections[d].second;
                    if (!grid.inBounds(r, c) || visited[r][c]) continue;
                    if (!compatible(grid.at(r, c))) continue;
                    visited[r][c] = true;
                    stack.push_back(Position{r, c});
                }
            }

            if (static_cast<int>(positions.size()) < cascade.minMatch) {
                // wilds of a discarded component stay available to later seeds
                for (const auto& p : positions) {
                    if (grid.at(p).isWild()) visited[p.row][p.reel] = false;
                }
                continue;
            }
            MatchGroup group;
            group.symbolId = seed.isWild() ? effectiveSymbolForWild(grid, algorithm, row, reel) : seed.symbol;
            group.count = static_cast<int>(positions.size());
            group.payout = lookupPayout(algorithm.payTable, group.symbolId, group.count);
            group.positions = std::move(positions);
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

std::vector<LineMatch> findWaysMatches(const Grid& grid, const AlgorithmConfig& algorithm) {
    std::vector<LineMatch> matches;
    const int height = grid.getHeight();
    const int width = grid.getWidth();

    for (const auto& kv : algorithm.payTable) {
        const int target = kv.first;
        auto matchesTarget = [&](const Cell& cell) {
            return cell.isWild() || (cell.isSymbol() && cell.symbol == target);
        };

        LineMatch line;
        line.symbolId = target;
        // reel 0 first, stop at the first reel without the symbol or a wild
        for (int reel = 0; reel < width; reel++) {
            size_t before = line.positions.size();
            for (int row = 0; row < height; row++) {
                if (matchesTarget(grid.at(row, reel))) line.positions.push_back(Position{row, reel});
            }
            if (line.positions.size() == before) break;
            line.length++;
        }
        if (line.length < kMinWaysLength) continue;

        line.count = static_cast<int>(line.positions.size());
        // extra rows in the counted reels scale the base pay
        line.payout = lookupPayout(algorithm.payTable, target, line.length) * line.count / line.length;
        matches.push_back(std::move(line));
    }
    return matches;
}

std::vector<MatchGroup> toMatchGroups(const std::vector<LineMatch>& lines) {
    std::vector<MatchGroup> groups;
    groups.reserve(lines.size());
    for (const auto& line : lines) {
        groups.push_back(MatchGroup{line.symbolId, line.positions, line.count, line.payout});
    }
    return groups;
}

std::vector<MatchGroup> findMatches(const Grid& grid, const AlgorithmConfig& algorithm,
                                    const CascadeConfig& cascade) {
    switch (cascade.matchMode) {
    case MatchMode::Adjacency:
        return findAdjacencyMatches(grid, algorithm, cascade);
    case MatchMode::Ways:
        return toMatchGroups(findWaysMatches(grid, algorithm));
    }
    return {};
}
