#ifndef GAMESTATE_HPP
#define GAMESTATE_HPP

#include <memory>
#include <string>

#include "GameError.hpp"
#include "GameSettings.hpp"
#include "Grid.hpp"
#include "Question.hpp"
#include "ScoreKeeper.hpp"

class GameState {
public:
	enum class Phase { Setup, Idle, QuestionPending, Resolving, Won };
	enum class AnswerOutcome { None, Correct, Incorrect };

	// Exists only while a cell is selected and its question not yet settled.
	struct PendingTurn {
		int cell;
		Question question;
		bool resolved;
		bool timedOut;
		AnswerOutcome outcome;
		int dwellElapsedMs;

		PendingTurn(int cellIn, const Question& questionIn);
	};

	struct WinSummary {
		ScoreKeeper::Snapshot scores;
		int gridSize;
		int revealedCells;
		int totalCells;
		bool byGuess;
	};

	Phase phase;
	Grid grid;
	ScoreKeeper scores;
	int questionPointer;
	std::unique_ptr<PendingTurn> pending;
	std::unique_ptr<WinSummary> summary;
	std::string lastMessage;

	GameState();
	void reset();
	GameError begin(const GameSettings& settings);
};

const char* phaseName(GameState::Phase phase);

#endif
