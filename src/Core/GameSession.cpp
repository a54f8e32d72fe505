#include "GameSession.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

#include "Config.hpp"

GameSession::GameSession()
	: settings(),
	  state(),
	  countdown(),
	  listeners() {
}

template <typename Callback>
void GameSession::notify(Callback callback) {
	std::vector<IGameListener*> targets = listeners;
	for (IGameListener* listener : targets) {
		callback(listener);
	}
}

GameError GameSession::start(const GameSettings& settingsIn) {
	GameError error = validate(settingsIn);
	if (error != GameError::None) {
		return reject(error, "start");
	}
	countdown.cancel();
	settings = settingsIn;
	error = state.begin(settings);
	if (error != GameError::None) {
		return reject(error, "start");
	}
	countdown.reset(settings.timeLimitSeconds);
	logStart();
	return GameError::None;
}

GameError GameSession::selectCell(int cellIndex) {
	if (state.phase != GameState::Phase::Idle) {
		return reject(GameError::InvalidSelection, "select cell");
	}
	if (!state.grid.inBounds(cellIndex)) {
		return reject(GameError::OutOfRange, "select cell");
	}
	if (state.grid.isRevealed(cellIndex)) {
		return reject(GameError::InvalidSelection, "select cell");
	}
	if (!settings.questionBank) {
		return reject(GameError::EmptyBank, "select cell");
	}
	Question question;
	GameError error = settings.questionBank->next(state.questionPointer, question);
	if (error != GameError::None) {
		return reject(error, "select cell");
	}
	state.lastMessage.clear();
	state.pending = std::make_unique<GameState::PendingTurn>(cellIndex, question);
	state.phase = GameState::Phase::QuestionPending;
	logSelection(cellIndex, question);
	countdown.start(settings.timeLimitSeconds,
		[this](int remaining) { onCountdownTick(remaining); },
		[this]() { onCountdownExpired(); });
	return GameError::None;
}

GameError GameSession::submitAnswer(int optionIndex) {
	GameError error = resolve(optionIndex, false);
	if (error != GameError::None) {
		return reject(error, "submit answer");
	}
	return GameError::None;
}

GameError GameSession::forceWin() {
	if (state.phase == GameState::Phase::Won) {
		return reject(GameError::AlreadyWon, "guess");
	}
	state.lastMessage.clear();
	// A correct answer on the last hidden cell already won the game outright.
	if (state.phase == GameState::Phase::Resolving && state.pending
		&& state.pending->outcome == GameState::AnswerOutcome::Correct && state.grid.isComplete()) {
		finishResolution();
		return GameError::None;
	}
	enterWon(true);
	return GameError::None;
}

void GameSession::returnToSetup() {
	countdown.reset(0);
	state.reset();
	settings = GameSettings();
}

void GameSession::update(int elapsedMs) {
	if (elapsedMs <= 0) {
		return;
	}
	if (state.phase == GameState::Phase::QuestionPending) {
		elapsedMs = countdown.update(elapsedMs);
		if (elapsedMs <= 0) {
			return;
		}
	}
	if (state.phase == GameState::Phase::Resolving && state.pending) {
		state.pending->dwellElapsedMs += elapsedMs;
		if (state.pending->dwellElapsedMs >= settings.feedbackDwellMs) {
			finishResolution();
		}
	}
}

void GameSession::addListener(IGameListener* listener) {
	if (listener && std::find(listeners.begin(), listeners.end(), listener) == listeners.end()) {
		listeners.push_back(listener);
	}
}

void GameSession::removeListener(IGameListener* listener) {
	listeners.erase(std::remove(listeners.begin(), listeners.end(), listener), listeners.end());
}

GameState::Phase GameSession::currentState() const {
	return state.phase;
}

const Question* GameSession::currentQuestion() const {
	return state.pending ? &state.pending->question : nullptr;
}

Grid GameSession::gridSnapshot() const {
	return state.grid;
}

ScoreKeeper::Snapshot GameSession::scoreSnapshot() const {
	return state.scores.snapshot();
}

int GameSession::remainingTime() const {
	return countdown.remaining();
}

int GameSession::selectedCell() const {
	return state.pending ? state.pending->cell : -1;
}

GameState::AnswerOutcome GameSession::lastOutcome() const {
	return state.pending ? state.pending->outcome : GameState::AnswerOutcome::None;
}

int GameSession::questionPointer() const {
	return state.questionPointer;
}

const std::string& GameSession::lastMessage() const {
	return state.lastMessage;
}

const GameState::WinSummary* GameSession::winSummary() const {
	return state.summary.get();
}

const GameState& GameSession::getState() const {
	return state;
}

const GameSettings& GameSession::getSettings() const {
	return settings;
}

GameError GameSession::validate(const GameSettings& candidate) const {
	if (!candidate.questionBank || candidate.questionBank->empty()) {
		return GameError::NoQuestions;
	}
	if (!Grid::isValidSize(candidate.gridSize)) {
		return GameError::InvalidSize;
	}
	if (candidate.timeLimitSeconds < 1) {
		return GameError::InvalidTimeLimit;
	}
	if (candidate.feedbackDwellMs < 0) {
		return GameError::InvalidConfig;
	}
	return GameError::None;
}

GameError GameSession::reject(GameError error, const std::string& command) {
	state.lastMessage = "Cannot " + command + ": " + describeError(error) + " (" + phaseName(state.phase) + ")";
	std::cout << "\033[33m" << state.lastMessage << "\033[0m" << std::endl;
	return error;
}

GameError GameSession::resolve(int optionIndex, bool timedOut) {
	GameState::PendingTurn* turn = state.pending.get();
	if (state.phase != GameState::Phase::QuestionPending || !turn || turn->resolved) {
		return GameError::InvalidSubmission;
	}
	if (!timedOut && (optionIndex < 0 || optionIndex >= turn->question.optionCount())) {
		return GameError::InvalidSubmission;
	}
	// Settle the turn before any side effect so a late answer or expiry is refused.
	turn->resolved = true;
	turn->timedOut = timedOut;
	countdown.cancel();
	state.lastMessage.clear();

	bool correct = !timedOut && turn->question.isCorrect(optionIndex);
	if (correct) {
		GameError revealError = state.grid.reveal(turn->cell);
		if (revealError != GameError::None) {
			std::cout << "\033[31mCell " << turn->cell << " could not be revealed: " << describeError(revealError) << "\033[0m" << std::endl;
			correct = false;
		}
	}
	if (correct) {
		state.scores.recordCorrect();
		turn->outcome = GameState::AnswerOutcome::Correct;
	} else {
		state.scores.recordIncorrect();
		turn->outcome = GameState::AnswerOutcome::Incorrect;
	}
	state.phase = GameState::Phase::Resolving;
	logJudged(*turn);

	int cell = turn->cell;
	GameState::AnswerOutcome outcome = turn->outcome;
	if (outcome == GameState::AnswerOutcome::Correct) {
		notify([cell](IGameListener* listener) { listener->onCellRevealed(cell); });
	}
	if (state.phase == GameState::Phase::Resolving && state.pending.get() == turn) {
		notify([outcome, cell](IGameListener* listener) { listener->onAnswerJudged(outcome, cell); });
	}

	// A listener may have reset the session while being notified.
	if (state.phase == GameState::Phase::Resolving && state.pending.get() == turn
		&& settings.feedbackDwellMs <= 0) {
		finishResolution();
	}
	return GameError::None;
}

void GameSession::finishResolution() {
	GameState::PendingTurn* turn = state.pending.get();
	if (state.phase != GameState::Phase::Resolving || !turn) {
		return;
	}
	if (turn->outcome == GameState::AnswerOutcome::Correct && state.grid.isComplete()) {
		enterWon(false);
		return;
	}
	state.pending.reset();
	state.phase = GameState::Phase::Idle;
	int bankSize = settings.questionBank ? static_cast<int>(settings.questionBank->size()) : 0;
	state.questionPointer = (bankSize > 0) ? (state.questionPointer + 1) % bankSize : 0;
	state.scores.endTurn();
	countdown.reset(settings.timeLimitSeconds);
	if (state.scores.getMode() == ScoreKeeper::Mode::Team) {
		logTurn();
		ScoreKeeper::TeamColor team = state.scores.getActiveTeam();
		notify([team](IGameListener* listener) { listener->onTurnChanged(team); });
	}
}

void GameSession::enterWon(bool byGuess) {
	countdown.cancel();
	state.pending.reset();
	state.phase = GameState::Phase::Won;
	std::unique_ptr<GameState::WinSummary> summary = std::make_unique<GameState::WinSummary>();
	summary->scores = state.scores.snapshot();
	summary->gridSize = state.grid.getSize();
	summary->revealedCells = state.grid.revealedCount();
	summary->totalCells = state.grid.cellCount();
	summary->byGuess = byGuess;
	state.summary = std::move(summary);
	logWin(*state.summary);
	GameState::WinSummary copy = *state.summary;
	notify([&copy](IGameListener* listener) { listener->onWon(copy); });
}

void GameSession::onCountdownTick(int remaining) {
	if (Config::kLogTimerTicks) {
		std::cout << "\033[90m" << turnTag() << " " << remaining << "s left\033[0m" << std::endl;
	}
}

void GameSession::onCountdownExpired() {
	GameError error = resolve(-1, true);
	if (error != GameError::None) {
		reject(error, "expire question");
	}
}

void GameSession::logStart() const {
	std::cout << "\033[90m" << modeName(settings.mode) << " game on a "
	          << settings.gridSize << "x" << settings.gridSize << " grid, "
	          << settings.timeLimitSeconds << "s per question, "
	          << settings.questionBank->size() << " questions\033[0m" << std::endl;
}

void GameSession::logSelection(int cell, const Question& question) const {
	std::ostringstream line;
	line << turnTag() << " opened cell " << cell << ": " << question.text;
	for (int i = 0; i < question.optionCount(); ++i) {
		line << "  " << static_cast<char>('A' + i) << ") " << question.options[static_cast<size_t>(i)];
	}
	std::cout << line.str() << std::endl;
}

void GameSession::logJudged(const GameState::PendingTurn& turn) const {
	std::ostringstream line;
	line << turnTag() << " cell " << turn.cell << " ";
	if (turn.outcome == GameState::AnswerOutcome::Correct) {
		line << "\033[32mcorrect\033[0m";
	} else if (turn.timedOut) {
		line << "\033[31mtime's up\033[0m";
	} else {
		line << "\033[31mwrong\033[0m";
	}
	line << " | \033[36m[" << state.grid.revealedCount() << "/" << state.grid.cellCount() << "]\033[0m";
	if (turn.outcome == GameState::AnswerOutcome::Correct) {
		line << " \033[32m+1!\033[0m";
	}
	std::cout << line.str() << std::endl;
}

void GameSession::logTurn() const {
	std::cout << "\033[90mNext turn: " << turnTag() << "\033[0m" << std::endl;
}

void GameSession::logWin(const GameState::WinSummary& summary) const {
	std::ostringstream line;
	if (summary.scores.mode == ScoreKeeper::Mode::Team) {
		line << "\033[31m[RED] " << summary.scores.redScore << "\033[0m - \033[34m"
		     << summary.scores.blueScore << " [BLUE]\033[0m ";
		if (summary.scores.outcome == ScoreKeeper::Outcome::RedWins) {
			line << "\033[35mRed team wins\033[0m";
		} else if (summary.scores.outcome == ScoreKeeper::Outcome::BlueWins) {
			line << "\033[35mBlue team wins\033[0m";
		} else {
			line << "\033[35mTie\033[0m";
		}
	} else {
		line << "\033[35mPicture solved\033[0m with " << summary.scores.soloScore << " points";
	}
	if (summary.byGuess) {
		line << " (guessed at " << summary.revealedCells << "/" << summary.totalCells << ")";
	}
	std::cout << line.str() << "." << std::endl;
}

std::string GameSession::turnTag() const {
	if (state.scores.getMode() == ScoreKeeper::Mode::Solo) {
		return "\033[97m[PLAYER]\033[0m";
	}
	return (state.scores.getActiveTeam() == ScoreKeeper::TeamColor::Red) ? "\033[31m[RED]\033[0m" : "\033[34m[BLUE]\033[0m";
}
