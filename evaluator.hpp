#pragma once

#include "context.hpp"
#include "token.hpp"

namespace memocalc {

// Evaluates a compiled operand against the current global state.
// Throws EvalError or RecursionError.
Complex evaluate(const Operand& operand, Context& context);
Complex evaluate(const Expression& expression, Context& context);
Complex evaluate(const FunctionCall& call, Context& context);

Complex applyOperator(const BinaryOperator& op, const Complex& left,
                      const Complex& right);

} // namespace memocalc
