#ifndef GAMESETTINGS_HPP
#define GAMESETTINGS_HPP

#include "ScoreKeeper.hpp"

class QuestionBank;

class GameSettings {
public:
	enum class GameMode { Solo, Team, Speed };

	GameMode mode;
	int gridSize;
	int timeLimitSeconds;
	int feedbackDwellMs;
	const QuestionBank* questionBank;

	GameSettings();

	ScoreKeeper::Mode scoreMode() const;
};

const char* modeName(GameSettings::GameMode mode);

#endif
