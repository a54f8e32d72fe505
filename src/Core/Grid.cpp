#include "Grid.hpp"

constexpr int Grid::kMinSize;
constexpr int Grid::kMaxSize;

Grid::Grid() : size(0), cells() {
}

bool Grid::isValidSize(int gridSize) {
	return gridSize >= kMinSize && gridSize <= kMaxSize;
}

GameError Grid::create(int gridSize) {
	if (!isValidSize(gridSize)) {
		return GameError::InvalidSize;
	}
	size = gridSize;
	cells.assign(static_cast<size_t>(size * size), Cell::Hidden);
	return GameError::None;
}

GameError Grid::reveal(int cellIndex) {
	if (!inBounds(cellIndex)) {
		return GameError::OutOfRange;
	}
	if (cells[static_cast<size_t>(cellIndex)] == Cell::Revealed) {
		return GameError::AlreadyRevealed;
	}
	cells[static_cast<size_t>(cellIndex)] = Cell::Revealed;
	return GameError::None;
}

void Grid::clear() {
	size = 0;
	cells.clear();
}

Grid::Cell Grid::at(int cellIndex) const {
	return cells[static_cast<size_t>(cellIndex)];
}

bool Grid::inBounds(int cellIndex) const {
	return cellIndex >= 0 && cellIndex < cellCount();
}

bool Grid::isRevealed(int cellIndex) const {
	return inBounds(cellIndex) && at(cellIndex) == Cell::Revealed;
}

bool Grid::isComplete() const {
	return !cells.empty() && revealedCount() == cellCount();
}

int Grid::revealedCount() const {
	int count = 0;
	for (size_t i = 0; i < cells.size(); ++i) {
		if (cells[i] == Cell::Revealed) {
			++count;
		}
	}
	return count;
}

int Grid::cellCount() const {
	return static_cast<int>(cells.size());
}

int Grid::getSize() const {
	return size;
}

int Grid::indexOf(int x, int y) const {
	return y * size + x;
}
