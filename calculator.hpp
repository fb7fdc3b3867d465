#pragma once

#include <optional>
#include <string>

#include "context.hpp"
#include "error.hpp"

namespace memocalc {

struct ExecResult {
    std::string output;
    std::optional<ErrorKind> error;
    bool exit = false;

    bool ok() const {
        return !error.has_value();
    }
};

// Command dispatch for one line of input. Never throws memocalc::Error; every
// user-facing failure comes back in the result.
class Calculator {
  public:
    explicit Calculator(Settings settings = Settings());

    ExecResult execute(const std::string& line);

    Context& context() {
        return context_;
    }

    const Context& context() const {
        return context_;
    }

    static const char* helpText();

  private:
    std::string run(const std::string& line, bool& exit);

    std::string deleteName(const std::string& name);
    std::string changePrecision(const std::string& argument);
    std::string listEnvironment() const;

    std::string defineFunction(const std::string& text);
    std::string defineBaseCase(const std::string& text);
    std::string defineVariable(const std::string& text);
    std::string evaluateExpression(const std::string& text);

    void storeAnswer(const Complex& value);

    Context context_;
};

} // namespace memocalc
