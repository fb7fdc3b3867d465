#include "token.hpp"

#include <stdexcept>

namespace memocalc {

bool BinaryOperator::isMultiplicative() const {
    return symbol == '*' || symbol == '/' || symbol == '%';
}

bool BinaryOperator::precedes(const BinaryOperator& other) const {
    if (symbol == '^' || other.symbol == '^') {
        return symbol == '^' && other.symbol != '^';
    }
    return isMultiplicative() && !other.isMultiplicative();
}

bool Grouper::matches(const Grouper& other) const {
    switch (symbol) {
    case '(':
        return other.symbol == ')';
    case ')':
        return other.symbol == '(';
    default:
        throw std::logic_error(std::string("INTERNAL ERROR: unknown grouper ") +
                               symbol);
    }
}

FunctionCall::FunctionCall(std::string name, std::vector<Operand> args)
    : name_(std::move(name))
    , args_(std::move(args)) {
    for (const Operand& arg : args_) {
        std::set<std::string> refs = memocalc::references(arg);
        references_.insert(refs.begin(), refs.end());
    }
    references_.insert(name_);
}

std::set<std::string> references(const Operand& operand) {
    return std::visit(
        Overloaded{
            [](const Numeral&) { return std::set<std::string>(); },
            [](const Variable& v) { return std::set<std::string>{v.name}; },
            [](const ExpressionPtr& e) {
                std::set<std::string> refs;
                for (const Token& token : e->tokens()) {
                    if (const Operand* inner = std::get_if<Operand>(&token)) {
                        std::set<std::string> sub = references(*inner);
                        refs.insert(sub.begin(), sub.end());
                    }
                }
                return refs;
            },
            [](const FunctionCallPtr& call) { return call->references(); },
        },
        operand);
}

std::string toString(const Operand& operand) {
    return std::visit(
        Overloaded{
            [](const Numeral& n) { return n.text; },
            [](const Variable& v) { return v.name; },
            [](const ExpressionPtr& e) {
                std::string out;
                for (const Token& token : e->tokens()) {
                    out += toString(token);
                }
                return out;
            },
            [](const FunctionCallPtr& call) {
                std::string out = call->name() + "[";
                for (std::size_t i = 0; i < call->args().size(); ++i) {
                    if (i != 0) {
                        out += ", ";
                    }
                    out += toString(call->args()[i]);
                }
                return out + "]";
            },
        },
        operand);
}

std::string toString(const Token& token) {
    return std::visit(
        Overloaded{
            [](const Operand& o) { return toString(o); },
            [](const BinaryOperator& op) { return std::string(1, op.symbol); },
            [](const Grouper& g) { return std::string(1, g.symbol); },
        },
        token);
}

} // namespace memocalc
