#include "calculator.hpp"

#include "compiler.hpp"
#include "evaluator.hpp"
#include "function.hpp"
#include "lexer.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <sstream>
#include <vector>

namespace memocalc {

namespace {

const char* kHelpText =
    "memocalc quick help:\n"
    "  reset              removes all user-defined variables and functions\n"
    "  exit               leaves the calculator\n"
    "  help               shows this text\n"
    "  env                lists all variables and functions\n"
    "  del <name>         deletes a variable or function\n"
    "  precision <n>      sets the number of significant digits\n"
    "  precision auto     prints every value in scientific notation\n"
    "\n"
    "Expressions: 3 + 2 * (5 - x). Whitespace is stripped, so `1 2 3` reads "
    "as `123`.\n"
    "Calls use brackets: f[x], sin[pi/2], min[2,3], sum[k,1,10,k^2].\n"
    "Variables: x = 5 + 4. The last result is kept in ans.\n"
    "Functions: f[x] = x^2 or g[] = 3. Parameters shadow globals during a "
    "call.\n"
    "Base cases: f[0] = 1 or g[0,0] = 2. Arguments and value must be "
    "numerals.\n";

const std::regex& functionDefinitionRegex() {
    static const std::regex re(
        std::string("(") + kIdentifierPattern + ")\\[((?:" +
        kIdentifierPattern + "(?:," + kIdentifierPattern + ")*)?)\\]=(.+)");
    return re;
}

const std::regex& baseCaseRegex() {
    static const std::regex re(
        std::string("(") + kIdentifierPattern + ")\\[(" + kNumeralPattern +
        "(?:," + kNumeralPattern + ")*)\\]=(" + kNumeralPattern + ")");
    return re;
}

const std::regex& variableDefinitionRegex() {
    static const std::regex re(std::string("(") + kIdentifierPattern +
                               ")=(.+)");
    return re;
}

std::vector<std::string> splitWords(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::string stripWhitespace(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> splitCommas(const std::string& text) {
    std::vector<std::string> parts;
    if (text.empty()) {
        return parts;
    }
    std::size_t start = 0;
    while (true) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, comma - start));
        start = comma + 1;
    }
}

bool isReservedName(const std::string& name) {
    return Context::isReservedFunction(name) ||
           Context::isReservedCommand(name);
}

} // namespace

Calculator::Calculator(Settings settings)
    : context_(settings) {}

const char* Calculator::helpText() {
    return kHelpText;
}

ExecResult Calculator::execute(const std::string& line) {
    ExecResult result;
    try {
        result.output = run(line, result.exit);
    } catch (const Error& ex) {
        result.error = ex.kind();
        result.output = std::string(kindName(ex.kind())) + " error: " +
                        ex.what();
    }
    return result;
}

std::string Calculator::run(const std::string& line, bool& exit) {
    std::vector<std::string> words = splitWords(line);
    if (words.empty()) {
        return "";
    }

    const std::string& command = words.front();
    if (command == "exit" && words.size() == 1) {
        exit = true;
        return "";
    }
    if (command == "del") {
        if (words.size() != 2) {
            return "Invalid command. Usage: del <name>";
        }
        return deleteName(words[1]);
    }
    if (command == "precision") {
        if (words.size() == 1) {
            if (context_.precision() == kAutoPrecision) {
                return "Precision is auto (significant figures).";
            }
            return "Precision is " + std::to_string(context_.precision()) +
                   " digit(s).";
        }
        if (words.size() != 2) {
            return "Invalid command. Usage: precision <number> | precision auto";
        }
        return changePrecision(words[1]);
    }

    std::string text = stripWhitespace(line);
    if (text.size() > kMaxInputLength) {
        throw CompileError("input is longer than " +
                           std::to_string(kMaxInputLength) + " characters");
    }
    if (text == "reset") {
        context_.reset();
        return "All variables and functions have been reset.";
    }
    if (text == "help") {
        return kHelpText;
    }
    if (text == "env") {
        return listEnvironment();
    }

    if (std::regex_match(text, functionDefinitionRegex())) {
        return defineFunction(text);
    }
    if (std::regex_match(text, baseCaseRegex())) {
        return defineBaseCase(text);
    }
    if (std::regex_match(text, variableDefinitionRegex())) {
        return defineVariable(text);
    }
    return evaluateExpression(text);
}

std::string Calculator::deleteName(const std::string& name) {
    if (context_.hasVariable(name)) {
        if (Context::isReservedVariable(name)) {
            return "Cannot delete reserved variable \"" + name + "\"";
        }
        context_.eraseVariable(name);
        context_.invalidate(name);
        return "Deleted variable \"" + name + "\"";
    }
    if (context_.findFunction(name)) {
        if (Context::isReservedFunction(name)) {
            return "Cannot delete reserved function \"" + name + "\"";
        }
        context_.eraseFunction(name);
        context_.invalidate(name);
        return "Deleted function \"" + name + "\"";
    }
    return "Variable or function \"" + name + "\" not found.";
}

std::string Calculator::changePrecision(const std::string& argument) {
    if (argument == "auto") {
        context_.setPrecision(kAutoPrecision);
        return "Precision set to auto (significant figures).";
    }
    bool digitsOnly = !argument.empty() && argument.size() <= 9 &&
                      std::all_of(argument.begin(), argument.end(),
                                  [](char c) {
                                      return std::isdigit(
                                                 static_cast<unsigned char>(c)) !=
                                             0;
                                  });
    long digits = digitsOnly ? std::stol(argument) : 0;
    if (digits < 1) {
        return "Invalid precision value. Must be a positive number.";
    }
    context_.setPrecision(digits);
    return "Precision set to " + std::to_string(digits) + " digit(s).";
}

std::string Calculator::listEnvironment() const {
    long precision = context_.precision();
    std::ostringstream out;
    if (precision == kAutoPrecision) {
        out << "Global precision: auto\n";
    } else {
        out << "Global precision: " << precision << " digits\n";
    }

    out << "Internal variables:\n";
    for (const auto& [name, value] : context_.variables()) {
        if (Context::isReservedVariable(name)) {
            out << "  " << name << " = " << formatComplex(value, precision)
                << '\n';
        }
    }
    out << "\nInternal functions:\n";
    for (const auto& [name, function] : context_.functions()) {
        if (Context::isReservedFunction(name)) {
            out << "  " << function->describe(precision) << '\n';
        }
    }
    out << "\nUser-defined variables:\n";
    for (const auto& [name, value] : context_.variables()) {
        if (!Context::isReservedVariable(name)) {
            out << "  " << name << " = " << formatComplex(value, precision)
                << '\n';
        }
    }
    out << "\nUser-defined functions:\n";
    for (const auto& [name, function] : context_.functions()) {
        if (Context::isReservedFunction(name)) {
            continue;
        }
        std::istringstream lines(function->describe(precision));
        std::string entry;
        while (std::getline(lines, entry)) {
            out << "  " << entry << '\n';
        }
    }
    std::string listing = out.str();
    if (!listing.empty() && listing.back() == '\n') {
        listing.pop_back();
    }
    return listing;
}

std::string Calculator::defineFunction(const std::string& text) {
    std::smatch match;
    std::regex_match(text, match, functionDefinitionRegex());
    std::string name = match[1].str();
    if (isReservedName(name)) {
        throw CompileError("\"" + name +
                           "\" is a reserved keyword and cannot be redefined");
    }

    std::vector<std::string> parameters = splitCommas(match[2].str());
    std::set<std::string> seen;
    for (const std::string& parameter : parameters) {
        if (context_.hasVariable(parameter) ||
            context_.findFunction(parameter) ||
            Context::isReservedCommand(parameter)) {
            throw CompileError("\"" + parameter +
                               "\" is already defined and cannot be used as "
                               "a function argument");
        }
        if (!seen.insert(parameter).second) {
            throw CompileError("function \"" + name +
                               "\" has duplicate argument \"" + parameter +
                               "\"");
        }
    }

    Operand body = compile(match[3].str(), context_.maxDepth());
    auto function = std::make_shared<UserFunction>(name, std::move(parameters),
                                                   std::move(body));
    FunctionPtr previous = context_.findFunction(name);
    if (auto user = std::dynamic_pointer_cast<UserFunction>(previous)) {
        if (user->arity() == function->arity()) {
            function->adoptBaseCases(*user);
        }
    }
    context_.setFunction(function);
    context_.invalidate(name);
    return function->describe(context_.precision());
}

std::string Calculator::defineBaseCase(const std::string& text) {
    std::smatch match;
    std::regex_match(text, match, baseCaseRegex());
    std::string name = match[1].str();
    if (isReservedName(name)) {
        throw CompileError("\"" + name +
                           "\" is a reserved keyword and cannot be redefined");
    }

    std::vector<Complex> args;
    for (const std::string& part : splitCommas(match[2].str())) {
        args.push_back(compileNumeral(part).value);
    }
    Complex value = compileNumeral(match[3].str()).value;

    std::shared_ptr<UserFunction> function =
        std::dynamic_pointer_cast<UserFunction>(context_.findFunction(name));
    if (!function) {
        std::vector<std::string> parameters;
        for (std::size_t i = 0; i < args.size(); ++i) {
            parameters.push_back("_" + std::to_string(i));
        }
        function = std::make_shared<UserFunction>(name, std::move(parameters),
                                                  std::nullopt);
        context_.setFunction(function);
    } else if (function->arity() != args.size()) {
        throw CompileError("function \"" + name + "\" takes " +
                           std::to_string(function->arity()) +
                           " argument(s) but the base case has " +
                           std::to_string(args.size()));
    }

    function->addBaseCase(args, value);
    function->clearCache();
    context_.invalidate(name);
    return function->describe(context_.precision());
}

std::string Calculator::defineVariable(const std::string& text) {
    std::smatch match;
    std::regex_match(text, match, variableDefinitionRegex());
    std::string name = match[1].str();
    if (Context::isReservedVariable(name) || Context::isReservedCommand(name)) {
        throw CompileError("\"" + name +
                           "\" is a reserved keyword and cannot be reassigned");
    }

    Operand expression = compile(match[2].str(), context_.maxDepth());
    Complex value = evaluate(expression, context_);
    context_.setVariable(name, value);
    context_.invalidate(name);
    storeAnswer(value);
    return name + " := " + formatComplex(value, context_.precision());
}

std::string Calculator::evaluateExpression(const std::string& text) {
    Operand expression = compile(text, context_.maxDepth());
    Complex value = evaluate(expression, context_);
    storeAnswer(value);
    return formatComplex(value, context_.precision());
}

void Calculator::storeAnswer(const Complex& value) {
    context_.setVariable("ans", value);
    context_.invalidate("ans");
}

} // namespace memocalc
