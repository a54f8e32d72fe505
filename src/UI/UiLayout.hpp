#ifndef UILAYOUT_HPP
#define UILAYOUT_HPP

class UiLayout {
public:
	int windowWidth;
	int windowHeight;
	int padding;
	int gridSize;
	int boardPixelSize;
	int cellSize;
	int boardX;
	int boardY;
	int timerBarX;
	int timerBarY;
	int timerBarWidth;
	int timerBarHeight;
	int answerX;
	int answerY;
	int answerWidth;
	int answerHeight;
	int answerGap;
	int answerColumns;
	int answerSlots;

	UiLayout();
	explicit UiLayout(int gridSizeIn);
	void updateForWindow(int width, int height, int gridSizeIn);
};

#endif
