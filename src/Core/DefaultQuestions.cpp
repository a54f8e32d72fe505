#include "DefaultQuestions.hpp"

#include <iostream>

QuestionBank makeDefaultQuestionBank() {
	const Question defaults[] = {
		Question("1", "What is 5 x 7?", {"30", "35", "40", "45"}, 1),
		Question("2", "What is 48 divided by 6?", {"6", "7", "8", "9"}, 2),
		Question("3", "What is 125 + 75?", {"190", "200", "210", "220"}, 1),
		Question("4", "What is 300 - 150?", {"100", "150", "200", "250"}, 1),
		Question("5", "A square has 5cm sides. What is its perimeter?", {"15cm", "20cm", "25cm", "30cm"}, 1),
		Question("6", "What is 9 x 4?", {"32", "34", "36", "38"}, 2),
		Question("7", "What is 81 divided by 9?", {"7", "8", "9", "10"}, 2),
		Question("8", "How many grams are in 1kg?", {"10g", "100g", "1000g", "10000g"}, 2),
		Question("9", "What is the largest 3-digit number?", {"100", "900", "990", "999"}, 3),
		Question("10", "What is 15 x 2?", {"25", "30", "35", "40"}, 1),
	};
	QuestionBank bank;
	for (const Question& question : defaults) {
		GameError error = bank.add(question);
		if (error != GameError::None) {
			std::cout << "\033[33mSkipping default question " << question.id << ": " << describeError(error) << "\033[0m" << std::endl;
		}
	}
	return bank;
}
