#ifndef GAMEERROR_HPP
#define GAMEERROR_HPP

enum class GameError {
	None,
	InvalidConfig,
	NoQuestions,
	InvalidSize,
	InvalidTimeLimit,
	InvalidSelection,
	InvalidSubmission,
	EmptyBank,
	AlreadyRevealed,
	OutOfRange,
	InvalidQuestion,
	AlreadyWon,
	SessionActive
};

const char* describeError(GameError error);
bool isConfigError(GameError error);

#endif
