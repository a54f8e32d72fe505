#include "GameSettings.hpp"

#include "Config.hpp"

GameSettings::GameSettings()
	: mode(GameMode::Solo),
	  gridSize(Config::kDefaultGridSize),
	  timeLimitSeconds(Config::kDefaultTimeLimitSeconds),
	  feedbackDwellMs(0),
	  questionBank(nullptr) {
}

ScoreKeeper::Mode GameSettings::scoreMode() const {
	return (mode == GameMode::Team) ? ScoreKeeper::Mode::Team : ScoreKeeper::Mode::Solo;
}

const char* modeName(GameSettings::GameMode mode) {
	switch (mode) {
	case GameSettings::GameMode::Solo:
		return "Solo";
	case GameSettings::GameMode::Team:
		return "Team";
	case GameSettings::GameMode::Speed:
		return "Speed";
	}
	return "Unknown";
}
