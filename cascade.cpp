#include "cascade.h"
#include <cmath>

CascadeEngine::CascadeEngine(const EngineConfig& config, std::shared_ptr<RandomSource> rng) :
    config(config),
    generator(config, std::move(rng)),
    detector(config.bonus, config.golden.wildSymbolId) {}

Grid CascadeEngine::generateInitialGrid(bool lean, WildLifecycle& lifecycle) {
    const int width = config.cascade.gridWidth;
    const int height = config.cascade.gridHeight;
    Grid grid(width, height);
    for (int row = 0; row < height; row++) {
        for (int reel = 0; reel < width; reel++) {
            Cell& cell = grid.at(row, reel);
            auto special = generator.drawSpecial();
            if (special) {
                cell = Cell::symbolCell(*special);
                continue;
            }
            int id = generator.drawSymbol(reel, lean);
            cell = Cell::symbolCell(id);
            if (generator.drawGolden(id)) cell.goldenIndex = lifecycle.addGolden(Position{row, reel}, id);
        }
    }
    return grid;
}

double CascadeEngine::cascadeMultiplier(int step) const {
    const auto& table = config.cascade.cascadeMultipliers;
    if (step < 1 || step > static_cast<int>(table.size())) return 1.0;
    return table[step - 1];
}

void CascadeEngine::applyGravity(Grid& grid, WildLifecycle& lifecycle) {
    const int width = grid.getWidth();
    const int height = grid.getHeight();
    for (int reel = 0; reel < width; reel++) {
        // bottom-up compaction keeps the relative order of survivors
        int writeRow = height - 1;
        for (int row = height - 1; row >= 0; row--) {
            Cell cell = grid.at(row, reel);
            if (cell.isEmpty()) continue;
            if (row != writeRow) {
                grid.at(writeRow, reel) = cell;
                grid.at(row, reel) = Cell::emptyCell();
                if (cell.isWild()) lifecycle.onWildMoved(Position{row, reel}, Position{writeRow, reel});
            }
            writeRow--;
        }
        // refills are never golden, never special, never leaned
        for (int row = writeRow; row >= 0; row--) {
            grid.at(row, reel) = Cell::symbolCell(generator.drawSymbol(reel));
        }
    }
}

CascadeOutcome CascadeEngine::run(Grid grid, WildLifecycle& lifecycle) {
    const int sentinel = config.golden.wildSymbolId;
    CascadeOutcome outcome;
    outcome.initialGrid = grid.toIds(sentinel);
    outcome.bonusTrigger = detector.detect(grid);

    for (int step = 1; step <= config.cascade.maxCascades; step++) {
        auto groups = findMatches(grid, config.algorithm, config.cascade);
        if (groups.empty()) break;

        CascadeStep record;
        record.stepNumber = step;
        record.multiplier = cascadeMultiplier(step);
        record.gridBefore = grid.toIds(sentinel);

        std::int64_t payout = 0;
        for (const auto& group : groups) payout += group.payout;
        record.stepWin = static_cast<std::int64_t>(std::llround(static_cast<double>(payout) * record.multiplier));

        lifecycle.removeMatched(grid, groups, step);
        const auto& created = lifecycle.getTracker().getNewWilds();
        record.newWilds.assign(created.begin(), created.end());
        record.gridAfterRemove = grid.toIds(sentinel);
        outcome.totalRemoved += grid.countEmpty();

        applyGravity(grid, lifecycle);
        record.gridAfter = grid.toIds(sentinel);
        record.removedGroups = std::move(groups);

        outcome.rawWin += record.stepWin;
        outcome.finalMultiplier = record.multiplier;
        outcome.steps.push_back(std::move(record));
    }

    outcome.finalGrid = grid.toIds(sentinel);
    outcome.goldenSymbols = lifecycle.getGoldens();
    outcome.wildTransitions = lifecycle.getTransitions();
    outcome.wildPositions = lifecycle.getTracker().positions();
    return outcome;
}

CascadeOutcome CascadeEngine::play(bool lean) {
    WildLifecycle lifecycle;
    Grid grid = generateInitialGrid(lean, lifecycle);
    return run(std::move(grid), lifecycle);
}
