#ifndef QUESTION_HPP
#define QUESTION_HPP

#include <string>
#include <vector>

class Question {
public:
	std::string id;
	std::string text;
	std::vector<std::string> options;
	int correctIndex;

	Question();
	Question(const std::string& idIn, const std::string& textIn, const std::vector<std::string>& optionsIn, int correctIndexIn);

	bool isValid() const;
	bool isCorrect(int optionIndex) const;
	int optionCount() const;
};

#endif
