#ifndef GAMECONTROLLER_HPP
#define GAMECONTROLLER_HPP

#include <string>

#include "GameSession.hpp"
#include "QuestionBank.hpp"

class GameController {
public:
	GameController(const GameSettings& settings, const QuestionBank& bank);

	GameError startGame();
	GameError onCellClicked(int x, int y);
	GameError onOptionChosen(int optionIndex);
	GameError onGuess();
	void onReturnToSetup();
	void tick(int elapsedMs);

	GameError updateSettings(const GameSettings& settings);
	GameError addQuestion(const Question& question);
	GameError removeQuestion(const std::string& id);
	GameError clearQuestions();

	void addListener(IGameListener* listener);
	void removeListener(IGameListener* listener);
	const GameSession& session() const;
	const QuestionBank& questions() const;
	const GameSettings& pendingSettings() const;

private:
	GameSettings settings;
	QuestionBank bank;
	GameSession game;

	bool inSetup() const;
};

#endif
