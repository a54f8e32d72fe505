#include "CoordinateMapper.hpp"

CoordinateMapper::CoordinateMapper(const UiLayout& layoutIn) : layout(layoutIn) {
}

bool CoordinateMapper::pixelToCell(int px, int py, int& outX, int& outY) const {
	if (px < layout.boardX || py < layout.boardY) {
		return false;
	}
	int x = (px - layout.boardX) / layout.cellSize;
	int y = (py - layout.boardY) / layout.cellSize;
	if (x >= layout.gridSize || y >= layout.gridSize) {
		return false;
	}
	outX = x;
	outY = y;
	return true;
}

bool CoordinateMapper::pixelToOption(int px, int py, int optionCount, int& outIndex) const {
	int shown = (optionCount < layout.answerSlots) ? optionCount : layout.answerSlots;
	for (int i = 0; i < shown; ++i) {
		int ox = 0;
		int oy = 0;
		optionToPixelOrigin(i, ox, oy);
		if (px >= ox && px < ox + layout.answerWidth && py >= oy && py < oy + layout.answerHeight) {
			outIndex = i;
			return true;
		}
	}
	return false;
}

void CoordinateMapper::cellToPixelOrigin(int x, int y, int& outPx, int& outPy) const {
	outPx = layout.boardX + x * layout.cellSize;
	outPy = layout.boardY + y * layout.cellSize;
}

void CoordinateMapper::optionToPixelOrigin(int index, int& outPx, int& outPy) const {
	int column = index % layout.answerColumns;
	int row = index / layout.answerColumns;
	outPx = layout.answerX + column * (layout.answerWidth + layout.answerGap);
	outPy = layout.answerY + row * (layout.answerHeight + layout.answerGap);
}
