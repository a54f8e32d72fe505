#include "UiLayout.hpp"

#include "Config.hpp"

UiLayout::UiLayout() : UiLayout(Config::kDefaultGridSize) {
}

UiLayout::UiLayout(int gridSizeIn) {
	updateForWindow(Config::kWindowWidth, Config::kWindowHeight, gridSizeIn);
}

void UiLayout::updateForWindow(int width, int height, int gridSizeIn) {
	windowWidth = width;
	windowHeight = height;
	padding = 40;
	gridSize = (gridSizeIn > 0) ? gridSizeIn : 1;
	timerBarHeight = 16;
	answerHeight = 70;
	answerGap = 16;
	answerColumns = 2;
	answerSlots = answerColumns * 2;
	int answersBlock = answerHeight * 2 + answerGap;
	int availableHeight = height - padding * 2 - timerBarHeight - answersBlock - answerGap * 2;
	int availableWidth = width - padding * 2;
	boardPixelSize = (availableWidth < availableHeight) ? availableWidth : availableHeight;
	if (boardPixelSize < 100) {
		boardPixelSize = 100;
	}
	cellSize = boardPixelSize / gridSize;
	boardPixelSize = cellSize * gridSize;
	boardX = (width - boardPixelSize) / 2;
	timerBarX = boardX;
	timerBarY = padding;
	timerBarWidth = boardPixelSize;
	boardY = timerBarY + timerBarHeight + answerGap;
	answerX = boardX;
	answerY = boardY + boardPixelSize + answerGap;
	answerWidth = (boardPixelSize - answerGap) / answerColumns;
}
