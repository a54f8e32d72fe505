#include "GridRenderer.hpp"

#include "CoordinateMapper.hpp"

void GridRenderer::render(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout, SDL_Texture* picture, int shakeOffset) {
	drawTimerBar(renderer, session, layout);
	drawTeamStrip(renderer, session, layout);
	drawPicture(renderer, layout, picture, shakeOffset);
	drawCovers(renderer, session, layout, shakeOffset);
	drawAnswers(renderer, session, layout);
}

void GridRenderer::drawPicture(SDL_Renderer* renderer, const UiLayout& layout, SDL_Texture* picture, int shakeOffset) {
	SDL_Rect target = {layout.boardX + shakeOffset, layout.boardY, layout.boardPixelSize, layout.boardPixelSize};
	if (picture) {
		SDL_RenderCopy(renderer, picture, nullptr, &target);
		return;
	}
	fillRect(renderer, target.x, target.y, target.w, target.h, SDL_Color{30, 30, 30, 255});
}

void GridRenderer::drawCovers(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout, int shakeOffset) {
	GameState::Phase phase = session.currentState();
	if (phase == GameState::Phase::Won) {
		return;
	}
	CoordinateMapper mapper(layout);
	Grid grid = session.gridSnapshot();
	int selected = session.selectedCell();
	SDL_Color cover = {56, 160, 220, 255};
	SDL_Color setupCover = {120, 140, 160, 255};
	SDL_Color selectedCover = {250, 190, 40, 255};
	SDL_Color border = {255, 255, 255, 255};
	for (int y = 0; y < layout.gridSize; ++y) {
		for (int x = 0; x < layout.gridSize; ++x) {
			int cell = y * layout.gridSize + x;
			if (phase != GameState::Phase::Setup && grid.isRevealed(cell)) {
				continue;
			}
			int px = 0;
			int py = 0;
			mapper.cellToPixelOrigin(x, y, px, py);
			px += shakeOffset;
			SDL_Color color = cover;
			if (phase == GameState::Phase::Setup) {
				color = setupCover;
			} else if (cell == selected) {
				color = selectedCover;
			}
			fillRect(renderer, px, py, layout.cellSize, layout.cellSize, color);
			outlineRect(renderer, px, py, layout.cellSize, layout.cellSize, border);
		}
	}
}

void GridRenderer::drawTimerBar(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout) {
	fillRect(renderer, layout.timerBarX, layout.timerBarY, layout.timerBarWidth, layout.timerBarHeight, SDL_Color{220, 225, 230, 255});
	int limit = session.getSettings().timeLimitSeconds;
	if (session.currentState() != GameState::Phase::QuestionPending || limit <= 0) {
		return;
	}
	int remaining = session.remainingTime();
	int width = layout.timerBarWidth * remaining / limit;
	SDL_Color color = {60, 190, 110, 255};
	if (remaining * 3 <= limit) {
		color = SDL_Color{230, 60, 60, 255};
	} else if (remaining * 3 <= limit * 2) {
		color = SDL_Color{240, 180, 40, 255};
	}
	fillRect(renderer, layout.timerBarX, layout.timerBarY, width, layout.timerBarHeight, color);
}

void GridRenderer::drawTeamStrip(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout) {
	ScoreKeeper::Snapshot scores = session.scoreSnapshot();
	if (scores.mode != ScoreKeeper::Mode::Team || session.currentState() == GameState::Phase::Setup) {
		return;
	}
	SDL_Color color = (scores.activeTeam == ScoreKeeper::TeamColor::Red) ? SDL_Color{225, 50, 80, 255} : SDL_Color{40, 120, 230, 255};
	int stripWidth = layout.padding / 2;
	fillRect(renderer, layout.boardX - stripWidth - 8, layout.boardY, stripWidth, layout.boardPixelSize, color);
	fillRect(renderer, layout.boardX + layout.boardPixelSize + 8, layout.boardY, stripWidth, layout.boardPixelSize, color);
}

void GridRenderer::drawAnswers(SDL_Renderer* renderer, const GameSession& session, const UiLayout& layout) {
	const Question* question = session.currentQuestion();
	if (!question) {
		return;
	}
	CoordinateMapper mapper(layout);
	bool judged = session.currentState() == GameState::Phase::Resolving;
	SDL_Color palette[] = {
		{225, 50, 80, 255},
		{40, 120, 230, 255},
		{240, 180, 40, 255},
		{60, 190, 110, 255},
	};
	int shown = (question->optionCount() < layout.answerSlots) ? question->optionCount() : layout.answerSlots;
	for (int i = 0; i < shown; ++i) {
		int px = 0;
		int py = 0;
		mapper.optionToPixelOrigin(i, px, py);
		SDL_Color color = palette[i % 4];
		if (judged) {
			color = question->isCorrect(i) ? SDL_Color{60, 190, 110, 255} : SDL_Color{170, 170, 170, 255};
		}
		fillRect(renderer, px, py, layout.answerWidth, layout.answerHeight, color);
		outlineRect(renderer, px, py, layout.answerWidth, layout.answerHeight, SDL_Color{255, 255, 255, 255});
		// Pips stand in for the option letter: one for A, two for B, ...
		int pip = layout.answerHeight / 5;
		for (int p = 0; p <= i; ++p) {
			fillRect(renderer, px + pip + p * pip * 2, py + pip * 2, pip, pip, SDL_Color{255, 255, 255, 255});
		}
	}
}

void GridRenderer::fillRect(SDL_Renderer* renderer, int x, int y, int w, int h, SDL_Color color) {
	SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
	SDL_Rect rect = {x, y, w, h};
	SDL_RenderFillRect(renderer, &rect);
}

void GridRenderer::outlineRect(SDL_Renderer* renderer, int x, int y, int w, int h, SDL_Color color) {
	SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
	SDL_Rect rect = {x, y, w, h};
	SDL_RenderDrawRect(renderer, &rect);
}
