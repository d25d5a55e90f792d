#include "grid.h"
#include <stdexcept>

Grid::Grid(int width, int height) :
    width(width),
    height(height),
    cells(static_cast<size_t>(width) * static_cast<size_t>(height)) {}

Cell& Grid::at(int row, int reel) {
    if (!inBounds(row, reel)) throw std::out_of_range("grid position out of range");
    return cells[static_cast<size_t>(row) * width + reel];
}

const Cell& Grid::at(int row, int reel) const {
    if (!inBounds(row, reel)) throw std::out_of_range("grid position out of range");
    return cells[static_cast<size_t>(row) * width + reel];
}

bool Grid::inBounds(int row, int reel) const {
    return row >= 0 && row < height && reel >= 0 && reel < width;
}

int Grid::countEmpty() const {
    int n = 0;
    for (const auto& c : cells) if (c.isEmpty()) n++;
    return n;
}

GridIds Grid::toIds(int sentinel) const {
    GridIds ids(height, std::vector<int>(width, sentinel));
    for (int row = 0; row < height; row++) {
        for (int reel = 0; reel < width; reel++) {
            const Cell& c = at(row, reel);
            if (c.isSymbol()) ids[row][reel] = c.symbol;
        }
    }
    return ids;
}

bool Grid::operator==(const Grid& o) const {
    if (width != o.width || height != o.height) return false;
    for (size_t i = 0; i < cells.size(); i++) {
        const Cell& a = cells[i];
        const Cell& b = o.cells[i];
        if (a.kind != b.kind || a.goldenIndex != b.goldenIndex) return false;
        if (a.isSymbol() && a.symbol != b.symbol) return false;
    }
    return true;
}
