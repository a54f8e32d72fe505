#ifndef SDLAPP_HPP
#define SDLAPP_HPP

#include <SDL2/SDL.h>

#include <string>

#include "CoordinateMapper.hpp"
#include "GameController.hpp"
#include "GridRenderer.hpp"
#include "IGameListener.hpp"
#include "UiLayout.hpp"

class SdlApp : public IGameListener {
public:
	SdlApp(GameController& controller, const UiLayout& layout, const std::string& picturePath);
	~SdlApp() override;

	bool init();
	void run();

	void onCellRevealed(int cell) override;
	void onAnswerJudged(GameState::AnswerOutcome outcome, int cell) override;
	void onTurnChanged(ScoreKeeper::TeamColor activeTeam) override;
	void onWon(const GameState::WinSummary& summary) override;

private:
	GameController& controller;
	UiLayout layout;
	GridRenderer renderer;
	std::string picturePath;
	SDL_Window* window;
	SDL_Renderer* sdlRenderer;
	SDL_Texture* picture;
	bool running;
	bool sdlInitialized;
	bool guessPending;
	Uint32 lastTicks;
	Uint32 shakeUntil;
	Uint32 flashUntil;
	SDL_Color flashColor;
	std::string statusMessage;

	void handleEvent(const SDL_Event& event);
	void handleSetupKey(SDL_Keycode key);
	void handlePlayKey(SDL_Keycode key);
	void handleClick(int px, int py);
	void render();
	void updateTitle();
	void refreshLayout();
	bool loadPicture();
	SDL_Surface* makeGeneratedPicture() const;
	void report(GameError error);
	void shutdown();
};

#endif
