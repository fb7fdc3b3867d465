#pragma once

#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "numeric.hpp"

namespace memocalc {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

struct Numeral {
    Complex value;
    std::string text;

    bool operator==(const Numeral& other) const {
        return value == other.value;
    }
};

struct Variable {
    std::string name;
};

class Expression;
class FunctionCall;

using ExpressionPtr = std::shared_ptr<const Expression>;
using FunctionCallPtr = std::shared_ptr<const FunctionCall>;

using Operand = std::variant<Numeral, Variable, ExpressionPtr, FunctionCallPtr>;

struct BinaryOperator {
    char symbol;

    // a.precedes(b): in "x a y b z", whether "x a y" is computed first.
    bool precedes(const BinaryOperator& other) const;
    bool isMultiplicative() const;
};

struct Grouper {
    char symbol;

    bool isOpening() const {
        return symbol == '(';
    }

    bool matches(const Grouper& other) const;
};

using Symbol = std::variant<BinaryOperator, Grouper>;
using Token = std::variant<Operand, BinaryOperator, Grouper>;

class Expression {
  public:
    explicit Expression(std::vector<Token> tokens)
        : tokens_(std::move(tokens)) {}

    const std::vector<Token>& tokens() const {
        return tokens_;
    }

  private:
    std::vector<Token> tokens_;
};

class FunctionCall {
  public:
    FunctionCall(std::string name, std::vector<Operand> args);

    const std::string& name() const {
        return name_;
    }

    const std::vector<Operand>& args() const {
        return args_;
    }

    const std::set<std::string>& references() const {
        return references_;
    }

  private:
    std::string name_;
    std::vector<Operand> args_;
    std::set<std::string> references_;
};

// Free variable and function names the operand depends on.
std::set<std::string> references(const Operand& operand);

std::string toString(const Operand& operand);
std::string toString(const Token& token);

} // namespace memocalc
