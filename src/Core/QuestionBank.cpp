#include "QuestionBank.hpp"

#include <algorithm>

QuestionBank::QuestionBank() : questions(), idCounter(0) {
}

GameError QuestionBank::next(int index, Question& outQuestion) const {
	if (questions.empty()) {
		return GameError::EmptyBank;
	}
	int count = static_cast<int>(questions.size());
	int wrapped = ((index % count) + count) % count;
	outQuestion = questions[static_cast<size_t>(wrapped)];
	return GameError::None;
}

GameError QuestionBank::add(const Question& question) {
	if (!question.isValid()) {
		return GameError::InvalidQuestion;
	}
	Question stored = question;
	if (stored.id.empty()) {
		stored.id = makeUniqueId();
	} else if (contains(stored.id)) {
		return GameError::InvalidQuestion;
	}
	questions.push_back(stored);
	return GameError::None;
}

void QuestionBank::remove(const std::string& id) {
	questions.erase(std::remove_if(questions.begin(), questions.end(), [&id](const Question& question) {
		return question.id == id;
	}), questions.end());
}

void QuestionBank::clear() {
	questions.clear();
}

bool QuestionBank::contains(const std::string& id) const {
	for (const Question& question : questions) {
		if (question.id == id) {
			return true;
		}
	}
	return false;
}

bool QuestionBank::empty() const {
	return questions.empty();
}

size_t QuestionBank::size() const {
	return questions.size();
}

const std::vector<Question>& QuestionBank::all() const {
	return questions;
}

std::string QuestionBank::makeUniqueId() {
	std::string id;
	do {
		++idCounter;
		id = "q" + std::to_string(idCounter);
	} while (contains(id));
	return id;
}
