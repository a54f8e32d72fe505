#include "GameController.hpp"

GameController::GameController(const GameSettings& settingsIn, const QuestionBank& bankIn)
	: settings(settingsIn),
	  bank(bankIn),
	  game() {
	settings.questionBank = &bank;
}

GameError GameController::startGame() {
	return game.start(settings);
}

GameError GameController::onCellClicked(int x, int y) {
	const Grid& grid = game.getState().grid;
	if (x < 0 || y < 0 || x >= grid.getSize() || y >= grid.getSize()) {
		return GameError::OutOfRange;
	}
	return game.selectCell(grid.indexOf(x, y));
}

GameError GameController::onOptionChosen(int optionIndex) {
	return game.submitAnswer(optionIndex);
}

GameError GameController::onGuess() {
	return game.forceWin();
}

void GameController::onReturnToSetup() {
	game.returnToSetup();
}

void GameController::tick(int elapsedMs) {
	game.update(elapsedMs);
}

GameError GameController::updateSettings(const GameSettings& settingsIn) {
	if (!inSetup()) {
		return GameError::SessionActive;
	}
	settings = settingsIn;
	settings.questionBank = &bank;
	return GameError::None;
}

GameError GameController::addQuestion(const Question& question) {
	if (!inSetup()) {
		return GameError::SessionActive;
	}
	return bank.add(question);
}

GameError GameController::removeQuestion(const std::string& id) {
	if (!inSetup()) {
		return GameError::SessionActive;
	}
	bank.remove(id);
	return GameError::None;
}

GameError GameController::clearQuestions() {
	if (!inSetup()) {
		return GameError::SessionActive;
	}
	bank.clear();
	return GameError::None;
}

void GameController::addListener(IGameListener* listener) {
	game.addListener(listener);
}

void GameController::removeListener(IGameListener* listener) {
	game.removeListener(listener);
}

const GameSession& GameController::session() const {
	return game;
}

const QuestionBank& GameController::questions() const {
	return bank;
}

const GameSettings& GameController::pendingSettings() const {
	return settings;
}

bool GameController::inSetup() const {
	return game.currentState() == GameState::Phase::Setup;
}
