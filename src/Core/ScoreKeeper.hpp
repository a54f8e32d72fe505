#ifndef SCOREKEEPER_HPP
#define SCOREKEEPER_HPP

class ScoreKeeper {
public:
	enum class Mode { Solo, Team };
	enum class TeamColor { Red, Blue };
	enum class Outcome { Solo, RedWins, BlueWins, Tie };

	struct Snapshot {
		Mode mode;
		int soloScore;
		int redScore;
		int blueScore;
		TeamColor activeTeam;
		Outcome outcome;
	};

	ScoreKeeper();
	explicit ScoreKeeper(Mode mode);

	void reset(Mode mode);
	void recordCorrect();
	void recordIncorrect();
	void endTurn();
	Outcome winner() const;

	Mode getMode() const;
	TeamColor getActiveTeam() const;
	int soloScore() const;
	int teamScore(TeamColor team) const;
	Snapshot snapshot() const;

private:
	Mode mode;
	int solo;
	int red;
	int blue;
	TeamColor activeTeam;
};

const char* teamName(ScoreKeeper::TeamColor team);
ScoreKeeper::TeamColor otherTeam(ScoreKeeper::TeamColor team);

#endif
