#include "compiler.hpp"

#include "error.hpp"
#include "lexer.hpp"

#include <regex>

namespace memocalc {

namespace {

const std::regex& numeralRegex() {
    static const std::regex re(kNumeralPattern);
    return re;
}

const std::regex& identifierRegex() {
    static const std::regex re(kIdentifierPattern);
    return re;
}

const std::regex& operatorRegex() {
    static const std::regex re(kOperatorPattern);
    return re;
}

const std::regex& grouperRegex() {
    static const std::regex re(kGrouperPattern);
    return re;
}

Token compileFragment(const Fragment& fragment, std::deque<std::string>& calls,
                      std::size_t maxDepth) {
    switch (fragment.kind) {
    case FragmentKind::Call: {
        if (calls.empty()) {
            throw std::logic_error("INTERNAL ERROR: call placeholder without "
                                   "queued call text");
        }
        std::string text = std::move(calls.front());
        calls.pop_front();
        return Operand(compileCall(text, maxDepth));
    }
    case FragmentKind::Numeral:
        return Operand(compileNumeral(fragment.text));
    case FragmentKind::Variable:
        return Operand(compileVariable(fragment.text));
    case FragmentKind::Operator:
        return compileOperator(fragment.text);
    case FragmentKind::Grouper:
        return compileGrouper(fragment.text);
    case FragmentKind::Invalid:
        break;
    }
    throw CompileError("\"" + fragment.text + "\" is not a valid token");
}

// Runs the reducer's state machine without values so malformed token orders
// fail before anything is evaluated.
void checkOrder(const std::vector<Token>& tokens) {
    bool expectingOperand = true;
    int depth = 0;
    for (const Token& token : tokens) {
        if (std::holds_alternative<Operand>(token)) {
            if (!expectingOperand) {
                throw CompileError("unexpected operand \"" + toString(token) +
                                   "\"");
            }
            expectingOperand = false;
        } else if (const Grouper* g = std::get_if<Grouper>(&token)) {
            if (g->isOpening()) {
                if (!expectingOperand) {
                    throw CompileError("unexpected opening symbol \"" +
                                       toString(token) + "\"");
                }
                ++depth;
                continue;
            }
            if (depth == 0) {
                throw CompileError("unmatched closing symbol \"" +
                                   toString(token) + "\"");
            }
            if (expectingOperand) {
                throw CompileError("unexpected closing symbol \"" +
                                   toString(token) + "\"");
            }
            --depth;
        } else {
            const BinaryOperator& op = std::get<BinaryOperator>(token);
            if (expectingOperand) {
                if (op.symbol == '-' || op.symbol == '+') {
                    continue;
                }
                throw CompileError("unexpected operator \"" + toString(token) +
                                   "\"");
            }
            expectingOperand = true;
        }
    }
    if (depth > 0) {
        throw CompileError("unmatched grouping symbol \"(\"");
    }
    if (expectingOperand) {
        throw CompileError("not enough operands for the last operator");
    }
}

} // namespace

bool isSpecialForm(const std::string& name) {
    return name == "sum" || name == "prod";
}

Operand compile(const std::string& source, std::size_t maxDepth) {
    LexResult lexed = lex(source);

    if (lexed.fragments.size() == 1) {
        Token token = compileFragment(lexed.fragments.front(), lexed.calls,
                                      maxDepth);
        if (Operand* operand = std::get_if<Operand>(&token)) {
            return std::move(*operand);
        }
        throw CompileError("\"" + source +
                           "\" is not a valid calculator expression");
    }

    std::vector<Token> tokens;
    tokens.reserve(lexed.fragments.size());
    for (const Fragment& fragment : lexed.fragments) {
        tokens.push_back(compileFragment(fragment, lexed.calls, maxDepth));
    }
    checkOrder(tokens);
    return Operand(std::make_shared<const Expression>(std::move(tokens)));
}

Numeral compileNumeral(const std::string& text) {
    if (!std::regex_match(text, numeralRegex())) {
        throw CompileError("\"" + text + "\" is not a valid numeral");
    }
    return Numeral{parseNumeral(text), text};
}

Variable compileVariable(const std::string& text) {
    if (!std::regex_match(text, identifierRegex())) {
        throw CompileError("\"" + text + "\" is not a valid variable");
    }
    return Variable{text};
}

BinaryOperator compileOperator(const std::string& text) {
    if (!std::regex_match(text, operatorRegex())) {
        throw CompileError("\"" + text + "\" is not a valid binary operator");
    }
    return BinaryOperator{text.front()};
}

Grouper compileGrouper(const std::string& text) {
    if (!std::regex_match(text, grouperRegex())) {
        throw CompileError("\"" + text + "\" is not a valid grouping symbol");
    }
    return Grouper{text.front()};
}

FunctionCallPtr compileCall(const std::string& text, std::size_t maxDepth) {
    if (maxDepth == 0) {
        throw RecursionError("function calls nested too deep");
    }
    std::size_t open = text.find('[');
    if (open == std::string::npos || text.back() != ']' ||
        !std::regex_match(text.begin(), text.begin() + open,
                          identifierRegex())) {
        throw CompileError("\"" + text + "\" is not a valid function call");
    }

    std::string name = text.substr(0, open);
    std::string inner = text.substr(open + 1, text.size() - open - 2);

    std::vector<Operand> args;
    for (const std::string& part : splitArguments(inner)) {
        if (part.empty()) {
            throw CompileError("\"" + text + "\" is not a valid function call");
        }
        args.push_back(compile(part, maxDepth - 1));
    }

    if (isSpecialForm(name)) {
        if (args.size() != 4) {
            throw CompileError("function \"" + name +
                               "\" must have exactly four arguments");
        }
        if (!std::holds_alternative<Variable>(args.front())) {
            throw CompileError("function \"" + name +
                               "\" first argument must be a variable");
        }
    }

    return std::make_shared<const FunctionCall>(name, std::move(args));
}

} // namespace memocalc
