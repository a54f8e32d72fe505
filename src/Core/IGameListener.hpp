#ifndef IGAMELISTENER_HPP
#define IGAMELISTENER_HPP

#include "GameState.hpp"
#include "ScoreKeeper.hpp"

// Presentation hooks. Listeners react to the session; they never feed state back.
class IGameListener {
public:
	virtual ~IGameListener() = default;
	virtual void onCellRevealed(int cell) = 0;
	virtual void onAnswerJudged(GameState::AnswerOutcome outcome, int cell) = 0;
	virtual void onTurnChanged(ScoreKeeper::TeamColor activeTeam) = 0;
	virtual void onWon(const GameState::WinSummary& summary) = 0;
};

#endif
