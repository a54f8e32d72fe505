#include "Config.hpp"
#include "DefaultQuestions.hpp"
#include "GameController.hpp"
#include "GameSettings.hpp"
#include "SdlApp.hpp"
#include "UiLayout.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#ifdef DEBUG_TESTS
#include "DebugTests.hpp"
#endif

namespace {
bool parseMode(const std::string& value, GameSettings::GameMode& outMode) {
	std::string lower = value;
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	if (lower == "solo" || lower == "classroom") {
		outMode = GameSettings::GameMode::Solo;
		return true;
	}
	if (lower == "team" || lower == "versus") {
		outMode = GameSettings::GameMode::Team;
		return true;
	}
	if (lower == "speed") {
		outMode = GameSettings::GameMode::Speed;
		return true;
	}
	return false;
}

bool parseNumber(const std::string& value, int minValue, int maxValue, int& outValue) {
	if (value.empty() || value.size() > 3) {
		return false;
	}
	for (char c : value) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	int parsed = std::stoi(value);
	if (parsed < minValue || parsed > maxValue) {
		return false;
	}
	outValue = parsed;
	return true;
}

void printUsage(const char* exe) {
	std::cout << "Usage: " << exe << " [--mode solo|team|speed] [--size 2-5] [--time "
	          << Config::kMinTimeLimitSeconds << "-" << Config::kMaxTimeLimitSeconds << "] [--image picture.bmp]\n"
	          << "       " << exe << " [-m solo|team|speed] [-s 2-5] [-t seconds] [-i picture.bmp]\n";
}

bool applyOption(const std::string& name, const std::string& value, GameSettings& settings, bool& timeGiven, std::string& picturePath) {
	if (name == "--mode" || name == "-m") {
		if (!parseMode(value, settings.mode)) {
			std::cerr << "Invalid mode: " << value << std::endl;
			return false;
		}
		return true;
	}
	if (name == "--size" || name == "-s") {
		if (!parseNumber(value, 2, 5, settings.gridSize)) {
			std::cerr << "Invalid grid size: " << value << std::endl;
			return false;
		}
		return true;
	}
	if (name == "--time" || name == "-t") {
		if (!parseNumber(value, Config::kMinTimeLimitSeconds, Config::kMaxTimeLimitSeconds, settings.timeLimitSeconds)) {
			std::cerr << "Invalid time limit: " << value << std::endl;
			return false;
		}
		timeGiven = true;
		return true;
	}
	if (name == "--image" || name == "-i") {
		picturePath = value;
		return true;
	}
	std::cerr << "Unknown argument: " << name << std::endl;
	return false;
}
}  // namespace

int main(int argc, char** argv) {
#ifdef DEBUG_TESTS
	runDebugTests();
	return 0;
#endif
	GameSettings settings;
	settings.feedbackDwellMs = Config::kFeedbackDwellMs;
	bool timeGiven = false;
	std::string picturePath;
	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		if (arg == "--help" || arg == "-h") {
			printUsage(argv[0]);
			return 0;
		}
		std::string name = arg;
		std::string value;
		size_t equals = arg.find('=');
		if (arg.rfind("--", 0) == 0 && equals != std::string::npos) {
			name = arg.substr(0, equals);
			value = arg.substr(equals + 1);
		} else if (i + 1 < argc) {
			value = argv[++i];
		} else {
			std::cerr << "Missing value for " << arg << std::endl;
			printUsage(argv[0]);
			return 1;
		}
		if (!applyOption(name, value, settings, timeGiven, picturePath)) {
			printUsage(argv[0]);
			return 1;
		}
	}
	if (settings.mode == GameSettings::GameMode::Speed && !timeGiven) {
		settings.timeLimitSeconds = Config::kSpeedTimeLimitSeconds;
	}
	GameController controller(settings, makeDefaultQuestionBank());
	UiLayout layout(settings.gridSize);
	SdlApp app(controller, layout, picturePath);
	app.run();
	return 0;
}
