#ifndef GRIDRENDERER_HPP
#define GRIDRENDERER_HPP

#include <SDL2/SDL.h>

#include "GameSession.hpp"
#include "UiLayout.hpp"

class GridRenderer {
public:
	void render(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout, SDL_Texture* picture, int shakeOffset);

private:
	void drawPicture(SDL_Renderer* renderer, const UiLayout& layout, SDL_Texture* picture, int shakeOffset);
	void drawCovers(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout, int shakeOffset);
	void drawTimerBar(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout);
	void drawTeamStrip(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout);
	void drawAnswers(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout);
	void fillRect(SDL_Renderer* renderer, int x, int y, int w, int h, SDL_Color color);
	void outlineRect(SDL_Renderer* renderer, int x, int y, int w, int h, SDL_Color color);
};

#endif
