#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace memocalc {

extern const char* const kIdentifierPattern;
extern const char* const kNumeralPattern;
extern const char* const kOperatorPattern;
extern const char* const kGrouperPattern;

// Stands in for an outermost function call while the rest of the text is
// classified. Never valid in user input.
constexpr char kCallPlaceholder = '\x1f';

// Longest whitespace-free input accepted by lex() and the calculator.
constexpr std::size_t kMaxInputLength = 4096;

enum class FragmentKind { Numeral, Variable, Operator, Grouper, Call, Invalid };

struct Fragment {
    FragmentKind kind;
    std::string text;
};

struct LexResult {
    std::vector<Fragment> fragments;
    // Raw text of every outermost call, in the order of the Call fragments.
    std::deque<std::string> calls;
};

// Splits whitespace-free text into classified fragments covering the whole
// input. Throws CompileError on the placeholder character, on an unclosed
// call bracket or on input longer than kMaxInputLength.
LexResult lex(const std::string& source);

// Splits the inside of "name[...]" on commas that are not nested in another
// call. Empty text yields no arguments.
std::vector<std::string> splitArguments(const std::string& inner);

} // namespace memocalc
