#ifndef COORDINATEMAPPER_HPP
#define COORDINATEMAPPER_HPP

#include "UiLayout.hpp"

class CoordinateMapper {
public:
	explicit CoordinateMapper(const UiLayout& layout);
	bool pixelToCell(int px, int py, int& outX, int& outY) const;
	bool pixelToOption(int px, int py, int optionCount, int& outIndex) const;
	void cellToPixelOrigin(int x, int y, int& outPx, int& outPy) const;
	void optionToPixelOrigin(int index, int& outPx, int& outPy) const;

private:
	UiLayout layout;
};

#endif
