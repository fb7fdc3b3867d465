#pragma once

#include <cstddef>
#include <string>

#include "error.hpp"
#include "token.hpp"

namespace memocalc {

// Compiles whitespace-free text into an operand: a lone numeral, variable or
// call is returned as is, anything longer becomes an Expression whose token
// order has already been checked. Throws CompileError, or RecursionError when
// calls nest more than `maxDepth` levels deep.
Operand compile(const std::string& source,
                std::size_t maxDepth = kDefaultMaxDepth);

Numeral compileNumeral(const std::string& text);
Variable compileVariable(const std::string& text);
BinaryOperator compileOperator(const std::string& text);
Grouper compileGrouper(const std::string& text);
FunctionCallPtr compileCall(const std::string& text,
                            std::size_t maxDepth = kDefaultMaxDepth);

bool isSpecialForm(const std::string& name);

} // namespace memocalc
