#include "DebugTests.hpp"

#include <cassert>
#include <vector>

#include "GameController.hpp"
#include "GameSession.hpp"
#include "IGameListener.hpp"
#include "QuestionBank.hpp"

namespace {
class RecordingListener : public IGameListener {
public:
	std::vector<int> revealed;
	std::vector<GameState::AnswerOutcome> judged;
	std::vector<ScoreKeeper::TeamColor> turns;
	int wins = 0;
	bool lastWinByGuess = false;

	void onCellRevealed(int cell) override {
		revealed.push_back(cell);
	}

	void onAnswerJudged(GameState::AnswerOutcome outcome, int) override {
		judged.push_back(outcome);
	}

	void onTurnChanged(ScoreKeeper::TeamColor activeTeam) override {
		turns.push_back(activeTeam);
	}

	void onWon(const GameState::WinSummary& summary) override {
		++wins;
		lastWinByGuess = summary.byGuess;
	}
};

class GuessingListener : public IGameListener {
public:
	explicit GuessingListener(GameSession& sessionIn) : session(sessionIn), judged(0) {
	}

	void onCellRevealed(int) override {
		GameError error = session.forceWin();
		assert(error == GameError::None);
	}

	void onAnswerJudged(GameState::AnswerOutcome, int) override {
		++judged;
	}

	void onTurnChanged(ScoreKeeper::TeamColor) override {
	}

	void onWon(const GameState::WinSummary&) override {
	}

	int judgedCount() const {
		return judged;
	}

private:
	GameSession& session;
	int judged;
};

class ResettingListener : public IGameListener {
public:
	explicit ResettingListener(GameSession& sessionIn) : session(sessionIn) {
	}

	void onCellRevealed(int) override {
	}

	void onAnswerJudged(GameState::AnswerOutcome, int) override {
		session.returnToSetup();
	}

	void onTurnChanged(ScoreKeeper::TeamColor) override {
	}

	void onWon(const GameState::WinSummary&) override {
	}

private:
	GameSession& session;
};

QuestionBank makeTwoQuestionBank() {
	QuestionBank bank;
	GameError first = bank.add(Question("q1", "Pick B", {"A", "B", "C", "D"}, 1));
	GameError second = bank.add(Question("q2", "Pick A", {"A", "B", "C", "D"}, 0));
	assert(first == GameError::None && second == GameError::None);
	return bank;
}

GameSettings makeSettings(const QuestionBank& bank, GameSettings::GameMode mode) {
	GameSettings settings;
	settings.mode = mode;
	settings.gridSize = 2;
	settings.timeLimitSeconds = 15;
	settings.feedbackDwellMs = 0;
	settings.questionBank = &bank;
	return settings;
}

void assertFreshSession(const GameSession& session) {
	GameSession fresh;
	assert(session.currentState() == fresh.currentState());
	assert(session.currentQuestion() == nullptr);
	assert(session.gridSnapshot().cellCount() == fresh.gridSnapshot().cellCount());
	assert(session.gridSnapshot().getSize() == fresh.gridSnapshot().getSize());
	ScoreKeeper::Snapshot scores = session.scoreSnapshot();
	ScoreKeeper::Snapshot freshScores = fresh.scoreSnapshot();
	assert(scores.mode == freshScores.mode);
	assert(scores.soloScore == freshScores.soloScore);
	assert(scores.redScore == freshScores.redScore);
	assert(scores.blueScore == freshScores.blueScore);
	assert(scores.activeTeam == freshScores.activeTeam);
	assert(session.remainingTime() == fresh.remainingTime());
	assert(session.selectedCell() == fresh.selectedCell());
	assert(session.lastOutcome() == fresh.lastOutcome());
	assert(session.questionPointer() == fresh.questionPointer());
	assert(session.winSummary() == nullptr);
}

void testSoloGameToCompletion() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	RecordingListener listener;
	session.addListener(&listener);
	assert(session.start(makeSettings(bank, GameSettings::GameMode::Solo)) == GameError::None);
	assert(session.currentState() == GameState::Phase::Idle);
	assert(session.remainingTime() == 15);
	assert(session.gridSnapshot().cellCount() == 4);

	assert(session.selectCell(0) == GameError::None);
	assert(session.currentState() == GameState::Phase::QuestionPending);
	assert(session.currentQuestion() && session.currentQuestion()->id == "q1");
	assert(session.remainingTime() == 15);
	assert(session.submitAnswer(1) == GameError::None);
	assert(session.currentState() == GameState::Phase::Idle);
	assert(session.gridSnapshot().isRevealed(0));
	assert(session.scoreSnapshot().soloScore == 1);
	assert(session.questionPointer() == 1);

	assert(session.selectCell(1) == GameError::None);
	assert(session.currentQuestion()->id == "q2");
	assert(session.submitAnswer(0) == GameError::None);
	assert(session.scoreSnapshot().soloScore == 2);
	assert(session.gridSnapshot().isRevealed(1));
	assert(session.questionPointer() == 0);

	assert(session.selectCell(2) == GameError::None);
	assert(session.currentQuestion()->id == "q1");
	assert(session.submitAnswer(1) == GameError::None);
	assert(session.currentState() == GameState::Phase::Idle);

	assert(session.selectCell(3) == GameError::None);
	assert(session.submitAnswer(0) == GameError::None);
	assert(session.currentState() == GameState::Phase::Won);
	assert(session.scoreSnapshot().soloScore == 4);
	assert(session.gridSnapshot().revealedCount() == 4);
	assert(session.winSummary() && !session.winSummary()->byGuess);
	assert(session.winSummary()->scores.outcome == ScoreKeeper::Outcome::Solo);

	assert(listener.revealed.size() == 4);
	assert(listener.judged.size() == 4);
	assert(listener.turns.empty());
	assert(listener.wins == 1);

	assert(session.selectCell(0) == GameError::InvalidSelection);
	assert(session.submitAnswer(0) == GameError::InvalidSubmission);
	assert(session.forceWin() == GameError::AlreadyWon);
	assert(listener.wins == 1);
}

void testTimeoutCountsAsIncorrect() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	RecordingListener listener;
	session.addListener(&listener);
	assert(session.start(makeSettings(bank, GameSettings::GameMode::Solo)) == GameError::None);
	assert(session.selectCell(2) == GameError::None);
	for (int second = 0; second < 14; ++second) {
		session.update(1000);
	}
	assert(session.currentState() == GameState::Phase::QuestionPending);
	assert(session.remainingTime() == 1);
	session.update(1000);
	assert(session.currentState() == GameState::Phase::Idle);
	assert(!session.gridSnapshot().isRevealed(2));
	assert(session.scoreSnapshot().soloScore == 0);
	assert(session.questionPointer() == 1);
	assert(session.remainingTime() == 15);
	assert(listener.judged.size() == 1 && listener.judged[0] == GameState::AnswerOutcome::Incorrect);
	assert(listener.revealed.empty());

	// Idle time does not run the countdown.
	session.update(60000);
	assert(session.currentState() == GameState::Phase::Idle);
	assert(listener.judged.size() == 1);
}

void testAnswerAndExpiryAreExclusive() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSettings settings = makeSettings(bank, GameSettings::GameMode::Solo);
	settings.feedbackDwellMs = 1500;
	GameSession session;
	RecordingListener listener;
	session.addListener(&listener);
	assert(session.start(settings) == GameError::None);

	assert(session.selectCell(0) == GameError::None);
	session.update(14000);
	assert(session.submitAnswer(1) == GameError::None);
	assert(session.currentState() == GameState::Phase::Resolving);
	assert(session.lastOutcome() == GameState::AnswerOutcome::Correct);
	assert(session.submitAnswer(1) == GameError::InvalidSubmission);
	assert(session.selectCell(1) == GameError::InvalidSelection);
	session.update(1000);
	assert(session.currentState() == GameState::Phase::Resolving);
	assert(listener.judged.size() == 1);
	session.update(500);
	assert(session.currentState() == GameState::Phase::Idle);
	assert(session.lastOutcome() == GameState::AnswerOutcome::None);
	assert(session.scoreSnapshot().soloScore == 1);

	assert(session.selectCell(1) == GameError::None);
	session.update(15000);
	assert(session.currentState() == GameState::Phase::Resolving);
	assert(session.lastOutcome() == GameState::AnswerOutcome::Incorrect);
	assert(session.submitAnswer(0) == GameError::InvalidSubmission);
	session.update(1500);
	assert(session.currentState() == GameState::Phase::Idle);
	assert(session.scoreSnapshot().soloScore == 1);
	assert(!session.gridSnapshot().isRevealed(1));
	assert(listener.judged.size() == 2);
}

void testForceWin() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	RecordingListener listener;
	session.addListener(&listener);
	assert(session.start(makeSettings(bank, GameSettings::GameMode::Solo)) == GameError::None);
	assert(session.selectCell(0) == GameError::None);
	assert(session.submitAnswer(1) == GameError::None);
	assert(session.selectCell(1) == GameError::None);
	assert(session.submitAnswer(0) == GameError::None);
	assert(session.selectCell(2) == GameError::None);

	assert(session.forceWin() == GameError::None);
	assert(session.currentState() == GameState::Phase::Won);
	assert(session.gridSnapshot().revealedCount() == 2);
	assert(session.winSummary()->byGuess);
	assert(session.winSummary()->revealedCells == 2);
	assert(session.winSummary()->totalCells == 4);
	assert(listener.wins == 1 && listener.lastWinByGuess);

	session.update(20000);
	assert(listener.judged.size() == 2);
	assert(session.selectCell(3) == GameError::InvalidSelection);
	assert(session.submitAnswer(0) == GameError::InvalidSubmission);
	assert(session.scoreSnapshot().soloScore == 2);
}

void testGuessDuringFinalFeedbackKeepsCompletionWin() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSettings settings = makeSettings(bank, GameSettings::GameMode::Solo);
	settings.feedbackDwellMs = 1500;
	GameSession session;
	RecordingListener listener;
	session.addListener(&listener);
	assert(session.start(settings) == GameError::None);
	const int answers[] = {1, 0, 1};
	for (int cell = 0; cell < 3; ++cell) {
		assert(session.selectCell(cell) == GameError::None);
		assert(session.submitAnswer(answers[cell]) == GameError::None);
		session.update(1500);
		assert(session.currentState() == GameState::Phase::Idle);
	}
	assert(session.selectCell(3) == GameError::None);
	assert(session.submitAnswer(0) == GameError::None);
	assert(session.currentState() == GameState::Phase::Resolving);
	assert(session.gridSnapshot().isComplete());

	assert(session.forceWin() == GameError::None);
	assert(session.currentState() == GameState::Phase::Won);
	assert(session.winSummary() && !session.winSummary()->byGuess);
	assert(session.winSummary()->revealedCells == 4);
	assert(listener.wins == 1 && !listener.lastWinByGuess);
	session.update(1500);
	assert(listener.wins == 1);
}

void testExpiryRemainderCountsTowardFeedback() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSettings settings = makeSettings(bank, GameSettings::GameMode::Solo);
	settings.feedbackDwellMs = 1500;
	GameSession session;
	assert(session.start(settings) == GameError::None);
	assert(session.selectCell(0) == GameError::None);
	session.update(16500);
	assert(session.currentState() == GameState::Phase::Idle);
	assert(session.questionPointer() == 1);
	assert(!session.gridSnapshot().isRevealed(0));

	assert(session.selectCell(0) == GameError::None);
	session.update(15500);
	assert(session.currentState() == GameState::Phase::Resolving);
	session.update(1000);
	assert(session.currentState() == GameState::Phase::Idle);
}

void testGuessFromRevealSkipsJudgement() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	GuessingListener listener(session);
	session.addListener(&listener);
	assert(session.start(makeSettings(bank, GameSettings::GameMode::Solo)) == GameError::None);
	assert(session.selectCell(0) == GameError::None);
	assert(session.submitAnswer(1) == GameError::None);
	assert(session.currentState() == GameState::Phase::Won);
	assert(session.winSummary()->byGuess);
	assert(session.winSummary()->revealedCells == 1);
	assert(listener.judgedCount() == 0);
	session.removeListener(&listener);
}

void testRejectedStartLeavesSessionUntouched() {
	QuestionBank empty;
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;

	GameSettings settings = makeSettings(empty, GameSettings::GameMode::Solo);
	assert(session.start(settings) == GameError::NoQuestions);
	assert(isConfigError(GameError::NoQuestions));
	settings.questionBank = nullptr;
	assert(session.start(settings) == GameError::NoQuestions);
	settings = makeSettings(bank, GameSettings::GameMode::Solo);
	settings.gridSize = 6;
	assert(session.start(settings) == GameError::InvalidSize);
	settings.gridSize = 1;
	assert(session.start(settings) == GameError::InvalidSize);
	settings.gridSize = 3;
	settings.timeLimitSeconds = 0;
	assert(session.start(settings) == GameError::InvalidTimeLimit);
	assert(session.currentState() == GameState::Phase::Setup);
	assert(!session.lastMessage().empty());

	assert(session.start(makeSettings(bank, GameSettings::GameMode::Solo)) == GameError::None);
	assert(session.lastMessage().empty());
	assert(session.selectCell(1) == GameError::None);
	settings.timeLimitSeconds = 0;
	assert(session.start(settings) == GameError::InvalidTimeLimit);
	assert(session.currentState() == GameState::Phase::QuestionPending);
	assert(session.selectedCell() == 1);
	assert(session.gridSnapshot().getSize() == 2);
}

void testRejectedCommands() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	assert(session.selectCell(0) == GameError::InvalidSelection);
	assert(session.submitAnswer(0) == GameError::InvalidSubmission);

	assert(session.start(makeSettings(bank, GameSettings::GameMode::Solo)) == GameError::None);
	assert(session.submitAnswer(0) == GameError::InvalidSubmission);
	assert(session.selectCell(4) == GameError::OutOfRange);
	assert(session.selectCell(-1) == GameError::OutOfRange);

	assert(session.selectCell(0) == GameError::None);
	assert(session.selectCell(0) == GameError::InvalidSelection);
	assert(session.selectCell(1) == GameError::InvalidSelection);
	assert(session.submitAnswer(4) == GameError::InvalidSubmission);
	assert(session.submitAnswer(-1) == GameError::InvalidSubmission);
	assert(session.currentState() == GameState::Phase::QuestionPending);
	assert(session.selectedCell() == 0);

	assert(session.submitAnswer(1) == GameError::None);
	assert(session.selectCell(0) == GameError::InvalidSelection);
	assert(session.gridSnapshot().revealedCount() == 1);
	assert(session.scoreSnapshot().soloScore == 1);
}

void testTeamTurns() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	RecordingListener listener;
	session.addListener(&listener);
	assert(session.start(makeSettings(bank, GameSettings::GameMode::Team)) == GameError::None);
	assert(session.scoreSnapshot().activeTeam == ScoreKeeper::TeamColor::Red);

	// Red answers q1 correctly.
	assert(session.selectCell(0) == GameError::None);
	assert(session.submitAnswer(1) == GameError::None);
	assert(session.scoreSnapshot().redScore == 1);
	assert(session.scoreSnapshot().activeTeam == ScoreKeeper::TeamColor::Blue);

	// Blue misses q2.
	assert(session.selectCell(1) == GameError::None);
	assert(session.submitAnswer(3) == GameError::None);
	assert(session.scoreSnapshot().blueScore == 0);
	assert(session.scoreSnapshot().activeTeam == ScoreKeeper::TeamColor::Red);

	// Red times out on q1.
	assert(session.selectCell(1) == GameError::None);
	session.update(15000);
	assert(session.scoreSnapshot().activeTeam == ScoreKeeper::TeamColor::Blue);

	// Blue answers q2, then Red answers q1 and Blue answers q2 to finish.
	assert(session.selectCell(1) == GameError::None);
	assert(session.submitAnswer(0) == GameError::None);
	assert(session.selectCell(2) == GameError::None);
	assert(session.submitAnswer(1) == GameError::None);
	assert(session.selectCell(3) == GameError::None);
	assert(session.submitAnswer(0) == GameError::None);

	assert(session.currentState() == GameState::Phase::Won);
	ScoreKeeper::Snapshot scores = session.scoreSnapshot();
	assert(scores.redScore == 2);
	assert(scores.blueScore == 2);
	assert(scores.outcome == ScoreKeeper::Outcome::Tie);
	assert(listener.turns.size() == 5);
	for (size_t i = 0; i < listener.turns.size(); ++i) {
		ScoreKeeper::TeamColor expected = (i % 2 == 0) ? ScoreKeeper::TeamColor::Blue : ScoreKeeper::TeamColor::Red;
		assert(listener.turns[i] == expected);
	}
}

void testSpeedScoresLikeSolo() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	GameSettings settings = makeSettings(bank, GameSettings::GameMode::Speed);
	settings.timeLimitSeconds = 5;
	assert(session.start(settings) == GameError::None);
	assert(session.remainingTime() == 5);
	assert(session.selectCell(0) == GameError::None);
	assert(session.submitAnswer(1) == GameError::None);
	ScoreKeeper::Snapshot scores = session.scoreSnapshot();
	assert(scores.mode == ScoreKeeper::Mode::Solo);
	assert(scores.soloScore == 1);
	assert(scores.activeTeam == ScoreKeeper::TeamColor::Red);
}

void testReturnToSetup() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	assertFreshSession(session);

	session.returnToSetup();
	assertFreshSession(session);

	assert(session.start(makeSettings(bank, GameSettings::GameMode::Team)) == GameError::None);
	session.returnToSetup();
	assertFreshSession(session);

	assert(session.start(makeSettings(bank, GameSettings::GameMode::Team)) == GameError::None);
	assert(session.selectCell(0) == GameError::None);
	session.returnToSetup();
	assertFreshSession(session);
	session.update(30000);
	assertFreshSession(session);

	GameSettings dwell = makeSettings(bank, GameSettings::GameMode::Solo);
	dwell.feedbackDwellMs = 1500;
	assert(session.start(dwell) == GameError::None);
	assert(session.selectCell(0) == GameError::None);
	assert(session.submitAnswer(1) == GameError::None);
	assert(session.currentState() == GameState::Phase::Resolving);
	session.returnToSetup();
	assertFreshSession(session);

	assert(session.start(makeSettings(bank, GameSettings::GameMode::Solo)) == GameError::None);
	assert(session.forceWin() == GameError::None);
	session.returnToSetup();
	assertFreshSession(session);
}

void testListenerMayResetDuringJudgement() {
	QuestionBank bank = makeTwoQuestionBank();
	GameSession session;
	ResettingListener listener(session);
	session.addListener(&listener);
	assert(session.start(makeSettings(bank, GameSettings::GameMode::Solo)) == GameError::None);
	assert(session.selectCell(0) == GameError::None);
	assert(session.submitAnswer(1) == GameError::None);
	assertFreshSession(session);
	session.removeListener(&listener);
}

void testControllerGuardsQuestionEditing() {
	GameSettings settings;
	settings.gridSize = 2;
	GameController controller(settings, makeTwoQuestionBank());
	assert(controller.addQuestion(Question("q3", "Pick C", {"A", "B", "C"}, 2)) == GameError::None);
	assert(controller.questions().size() == 3);
	assert(controller.startGame() == GameError::None);
	assert(controller.addQuestion(Question("q4", "Pick A", {"A", "B"}, 0)) == GameError::SessionActive);
	assert(controller.removeQuestion("q1") == GameError::SessionActive);
	assert(controller.clearQuestions() == GameError::SessionActive);
	assert(controller.updateSettings(settings) == GameError::SessionActive);
	assert(controller.questions().size() == 3);

	assert(controller.onCellClicked(2, 0) == GameError::OutOfRange);
	assert(controller.onCellClicked(1, 1) == GameError::None);
	assert(controller.session().selectedCell() == 3);
	assert(controller.onOptionChosen(1) == GameError::None);
	assert(controller.session().gridSnapshot().isRevealed(3));

	controller.onReturnToSetup();
	assert(controller.clearQuestions() == GameError::None);
	assert(controller.startGame() == GameError::NoQuestions);
	assert(controller.session().currentState() == GameState::Phase::Setup);
}
}  // namespace

void runSessionTests() {
	testSoloGameToCompletion();
	testTimeoutCountsAsIncorrect();
	testAnswerAndExpiryAreExclusive();
	testForceWin();
	testGuessDuringFinalFeedbackKeepsCompletionWin();
	testExpiryRemainderCountsTowardFeedback();
	testGuessFromRevealSkipsJudgement();
	testRejectedStartLeavesSessionUntouched();
	testRejectedCommands();
	testTeamTurns();
	testSpeedScoresLikeSolo();
	testReturnToSetup();
	testListenerMayResetDuringJudgement();
	testControllerGuardsQuestionEditing();
}
