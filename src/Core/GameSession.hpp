#ifndef GAMESESSION_HPP
#define GAMESESSION_HPP

#include <string>
#include <vector>

#include "Countdown.hpp"
#include "GameError.hpp"
#include "GameSettings.hpp"
#include "GameState.hpp"
#include "Grid.hpp"
#include "IGameListener.hpp"
#include "Question.hpp"
#include "QuestionBank.hpp"
#include "ScoreKeeper.hpp"

class GameSession {
public:
	GameSession();
	GameSession(const GameSession&) = delete;
	GameSession& operator=(const GameSession&) = delete;

	GameError start(const GameSettings& settings);
	GameError selectCell(int cellIndex);
	GameError submitAnswer(int optionIndex);
	GameError forceWin();
	void returnToSetup();
	void update(int elapsedMs);

	void addListener(IGameListener* listener);
	void removeListener(IGameListener* listener);

	GameState::Phase currentState() const;
	const Question* currentQuestion() const;
	Grid gridSnapshot() const;
	ScoreKeeper::Snapshot scoreSnapshot() const;
	int remainingTime() const;
	int selectedCell() const;
	GameState::AnswerOutcome lastOutcome() const;
	int questionPointer() const;
	const std::string& lastMessage() const;
	const GameState::WinSummary* winSummary() const;
	const GameState& getState() const;
	const GameSettings& getSettings() const;

private:
	GameSettings settings;
	GameState state;
	Countdown countdown;
	std::vector<IGameListener*> listeners;

	GameError validate(const GameSettings& candidate) const;
	GameError reject(GameError error, const std::string& command);
	GameError resolve(int optionIndex, bool timedOut);
	void finishResolution();
	void enterWon(bool byGuess);
	void onCountdownTick(int remaining);
	void onCountdownExpired();

	template <typename Callback>
	void notify(Callback callback);

	void logStart() const;
	void logSelection(int cell, const Question& question) const;
	void logJudged(const GameState::PendingTurn& turn) const;
	void logTurn() const;
	void logWin(const GameState::WinSummary& summary) const;
	std::string turnTag() const;
};

#endif
