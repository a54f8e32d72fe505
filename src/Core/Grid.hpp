#ifndef GRID_HPP
#define GRID_HPP

#include <cstddef>
#include <vector>

#include "GameError.hpp"

class Grid {
public:
	enum class Cell { Hidden, Revealed };

	static constexpr int kMinSize = 2;
	static constexpr int kMaxSize = 5;

	Grid();

	static bool isValidSize(int gridSize);

	GameError create(int gridSize);
	GameError reveal(int cellIndex);
	void clear();

	Cell at(int cellIndex) const;
	bool inBounds(int cellIndex) const;
	bool isRevealed(int cellIndex) const;
	bool isComplete() const;
	int revealedCount() const;
	int cellCount() const;
	int getSize() const;
	int indexOf(int x, int y) const;

private:
	int size;
	std::vector<Cell> cells;
};

#endif
