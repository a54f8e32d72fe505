#include "ScoreKeeper.hpp"

ScoreKeeper::ScoreKeeper() : ScoreKeeper(Mode::Solo) {
}

ScoreKeeper::ScoreKeeper(Mode modeIn)
	: mode(modeIn),
	  solo(0),
	  red(0),
	  blue(0),
	  activeTeam(TeamColor::Red) {
}

void ScoreKeeper::reset(Mode modeIn) {
	mode = modeIn;
	solo = 0;
	red = 0;
	blue = 0;
	activeTeam = TeamColor::Red;
}

void ScoreKeeper::recordCorrect() {
	if (mode == Mode::Solo) {
		++solo;
	} else if (activeTeam == TeamColor::Red) {
		++red;
	} else {
		++blue;
	}
}

void ScoreKeeper::recordIncorrect() {
}

void ScoreKeeper::endTurn() {
	if (mode == Mode::Team) {
		activeTeam = otherTeam(activeTeam);
	}
}

ScoreKeeper::Outcome ScoreKeeper::winner() const {
	if (mode == Mode::Solo) {
		return Outcome::Solo;
	}
	if (red > blue) {
		return Outcome::RedWins;
	}
	if (blue > red) {
		return Outcome::BlueWins;
	}
	return Outcome::Tie;
}

ScoreKeeper::Mode ScoreKeeper::getMode() const {
	return mode;
}

ScoreKeeper::TeamColor ScoreKeeper::getActiveTeam() const {
	return activeTeam;
}

int ScoreKeeper::soloScore() const {
	return solo;
}

int ScoreKeeper::teamScore(TeamColor team) const {
	return (team == TeamColor::Red) ? red : blue;
}

ScoreKeeper::Snapshot ScoreKeeper::snapshot() const {
	Snapshot snap;
	snap.mode = mode;
	snap.soloScore = solo;
	snap.redScore = red;
	snap.blueScore = blue;
	snap.activeTeam = activeTeam;
	snap.outcome = winner();
	return snap;
}

const char* teamName(ScoreKeeper::TeamColor team) {
	return (team == ScoreKeeper::TeamColor::Red) ? "Red" : "Blue";
}

ScoreKeeper::TeamColor otherTeam(ScoreKeeper::TeamColor team) {
	return (team == ScoreKeeper::TeamColor::Red) ? ScoreKeeper::TeamColor::Blue : ScoreKeeper::TeamColor::Red;
}
