#ifndef QUESTIONBANK_HPP
#define QUESTIONBANK_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "GameError.hpp"
#include "Question.hpp"

class QuestionBank {
public:
	QuestionBank();

	GameError next(int index, Question& outQuestion) const;
	GameError add(const Question& question);
	void remove(const std::string& id);
	void clear();

	bool contains(const std::string& id) const;
	bool empty() const;
	size_t size() const;
	const std::vector<Question>& all() const;

private:
	std::vector<Question> questions;
	int idCounter;

	std::string makeUniqueId();
};

#endif
