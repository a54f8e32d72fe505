#ifndef DEFAULTQUESTIONS_HPP
#define DEFAULTQUESTIONS_HPP

#include "QuestionBank.hpp"

// Primary-school arithmetic set used when no other questions are supplied.
QuestionBank makeDefaultQuestionBank();

#endif
