#include "Question.hpp"

Question::Question() : id(), text(), options(), correctIndex(0) {
}

Question::Question(const std::string& idIn, const std::string& textIn, const std::vector<std::string>& optionsIn, int correctIndexIn)
	: id(idIn),
	  text(textIn),
	  options(optionsIn),
	  correctIndex(correctIndexIn) {
}

bool Question::isValid() const {
	if (text.empty() || options.size() < 2) {
		return false;
	}
	for (const std::string& option : options) {
		if (option.empty()) {
			return false;
		}
	}
	return correctIndex >= 0 && correctIndex < optionCount();
}

bool Question::isCorrect(int optionIndex) const {
	return optionIndex == correctIndex;
}

int Question::optionCount() const {
	return static_cast<int>(options.size());
}
