#include "GameError.hpp"

const char* describeError(GameError error) {
	switch (error) {
	case GameError::None:
		return "ok";
	case GameError::InvalidConfig:
		return "invalid configuration";
	case GameError::NoQuestions:
		return "add at least one question before starting";
	case GameError::InvalidSize:
		return "grid size must be between 2 and 5";
	case GameError::InvalidTimeLimit:
		return "time limit must be at least 1 second";
	case GameError::InvalidSelection:
		return "cell cannot be selected now";
	case GameError::InvalidSubmission:
		return "no question is waiting for this answer";
	case GameError::EmptyBank:
		return "question bank is empty";
	case GameError::AlreadyRevealed:
		return "cell is already revealed";
	case GameError::OutOfRange:
		return "cell index out of range";
	case GameError::InvalidQuestion:
		return "question needs a prompt, non-empty options and a valid answer";
	case GameError::AlreadyWon:
		return "game is already won";
	case GameError::SessionActive:
		return "questions can only be edited during setup";
	}
	return "unknown error";
}

bool isConfigError(GameError error) {
	return error == GameError::InvalidConfig
		|| error == GameError::NoQuestions
		|| error == GameError::InvalidSize
		|| error == GameError::InvalidTimeLimit;
}
