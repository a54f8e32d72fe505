#include "GameState.hpp"

GameState::PendingTurn::PendingTurn(int cellIn, const Question& questionIn)
	: cell(cellIn),
	  question(questionIn),
	  resolved(false),
	  timedOut(false),
	  outcome(AnswerOutcome::None),
	  dwellElapsedMs(0) {
}

GameState::GameState()
	: phase(Phase::Setup),
	  grid(),
	  scores(),
	  questionPointer(0),
	  pending(),
	  summary(),
	  lastMessage() {
}

void GameState::reset() {
	phase = Phase::Setup;
	grid.clear();
	scores.reset(ScoreKeeper::Mode::Solo);
	questionPointer = 0;
	pending.reset();
	summary.reset();
	lastMessage.clear();
}

GameError GameState::begin(const GameSettings& settings) {
	reset();
	GameError error = grid.create(settings.gridSize);
	if (error != GameError::None) {
		return error;
	}
	scores.reset(settings.scoreMode());
	phase = Phase::Idle;
	return GameError::None;
}

const char* phaseName(GameState::Phase phase) {
	switch (phase) {
	case GameState::Phase::Setup:
		return "Setup";
	case GameState::Phase::Idle:
		return "Idle";
	case GameState::Phase::QuestionPending:
		return "QuestionPending";
	case GameState::Phase::Resolving:
		return "Resolving";
	case GameState::Phase::Won:
		return "Won";
	}
	return "Unknown";
}
