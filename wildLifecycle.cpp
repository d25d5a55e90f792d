#include "wildLifecycle.h"

void WildTracker::registerWild(const Position& pos, int sourceSymbol) {
    activeWilds[pos] = pos;
    wildSources[pos] = sourceSymbol;
    newWilds.insert(pos);
}

void WildTracker::relocate(const Position& from, const Position& to) {
    if (from == to) return;
    auto it = activeWilds.find(from);
    if (it != activeWilds.end()) {
        activeWilds.erase(it);
        activeWilds[to] = to;
    }
    auto src = wildSources.find(from);
    if (src != wildSources.end()) {
        int source = src->second;
        wildSources.erase(src);
        wildSources[to] = source;
    }
    if (newWilds.erase(from) != 0) newWilds.insert(to);
}

bool WildTracker::remove(const Position& pos) {
    bool existed = activeWilds.erase(pos) != 0;
    wildSources.erase(pos);
    newWilds.erase(pos);
    return existed;
}

int WildTracker::sourceOf(const Position& pos) const {
    auto it = wildSources.find(pos);
    return it == wildSources.end() ? -1 : it->second;
}

std::vector<Position> WildTracker::positions() const {
    std::vector<Position> out;
    out.reserve(activeWilds.size());
    for (const auto& kv : activeWilds) out.push_back(kv.second);
    return out;
}

int WildLifecycle::addGolden(const Position& pos, int originalId) {
    goldens.push_back(GoldenSymbolInfo{pos, originalId, true, false});
    return static_cast<int>(goldens.size()) - 1;
}

std::vector<Position> WildLifecycle::removeMatched(Grid& grid, const std::vector<MatchGroup>& matches, int step) {
    tracker.beginStep();

    // union of matched cells; a wild shared by two groups is removed once
    std::set<Position> marked;
    for (const auto& group : matches) {
        for (const auto& pos : group.positions) marked.insert(pos);
    }

    for (const auto& pos : marked) {
        if (!grid.at(pos).isWild()) continue;
        transitions.push_back(WildTransition{step, pos, tracker.sourceOf(pos), false, true, true});
    }

    // golden -> wild first, so no converted cell is ever seen as empty
    std::vector<Position> converted;
    for (const auto& pos : marked) {
        Cell& cell = grid.at(pos);
        if (!cell.isSymbol() || !cell.isGolden()) continue;
        GoldenSymbolInfo& golden = goldens.at(cell.goldenIndex);
        golden.becameWild = true;
        tracker.registerWild(pos, golden.originalId);
        transitions.push_back(WildTransition{step, pos, golden.originalId, true, false, false});
        cell = Cell::wildCell();
        converted.push_back(pos);
    }

    // then clear everything else that matched
    std::set<Position> keep(converted.begin(), converted.end());
    for (const auto& pos : marked) {
        if (keep.count(pos)) continue;
        Cell& cell = grid.at(pos);
        if (cell.isWild()) tracker.remove(pos);
        cell = Cell::emptyCell();
    }
    return converted;
}

void WildLifecycle::onWildMoved(const Position& from, const Position& to) {
    tracker.relocate(from, to);
}
