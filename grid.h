#pragma once
#include <cstdint>
#include <vector>

struct Position {
    int row = 0;
    int reel = 0;

    bool operator==(const Position& o) const { return row == o.row && reel == o.reel; }
    bool operator!=(const Position& o) const { return !(*this == o); }
    bool operator<(const Position& o) const {
        return row != o.row ? row < o.row : reel < o.reel;
    }
};

// [row][reel] ids, the external grid format
using GridIds = std::vector<std::vector<int>>;

// wild and empty share one sentinel outside the engine; inside they never mix
enum class CellKind : std::uint8_t { Symbol, Wild, Empty };

struct Cell {
    CellKind kind = CellKind::Empty;
    int symbol = 0;
    // index into the spin's golden report, -1 when the cell is not golden
    int goldenIndex = -1;

    static Cell symbolCell(int id) { return Cell{CellKind::Symbol, id, -1}; }
    static Cell wildCell() { return Cell{CellKind::Wild, 0, -1}; }
    static Cell emptyCell() { return Cell{}; }

    bool isSymbol() const { return kind == CellKind::Symbol; }
    bool isWild() const { return kind == CellKind::Wild; }
    bool isEmpty() const { return kind == CellKind::Empty; }
    bool isGolden() const { return goldenIndex >= 0; }
};

// rows top to bottom, reels left to right; gravity pulls toward the last row
class Grid {
private:
    int width;
    int height;
    std::vector<Cell> cells;

public:
    Grid(int width, int height);

    int getWidth() const { return width; }
    int getHeight() const { return height; }

    Cell& at(int row, int reel);
    const Cell& at(int row, int reel) const;
    Cell& at(const Position& pos) { return at(pos.row, pos.reel); }
    const Cell& at(const Position& pos) const { return at(pos.row, pos.reel); }

    bool inBounds(int row, int reel) const;
    int countEmpty() const;

    // serialization boundary: wild and empty both become the sentinel
    GridIds toIds(int sentinel) const;

    bool operator==(const Grid& o) const;
    bool operator!=(const Grid& o) const { return !(*this == o); }
};
