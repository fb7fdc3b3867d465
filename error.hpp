#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace memocalc {

// Ceiling on nested calls, both in source text and during evaluation.
constexpr std::size_t kDefaultMaxDepth = 1000;

enum class ErrorKind { Compile, Eval, Recursion };

// User-facing failure. Internal defects are reported with std::logic_error
// instead and are never caught by the calculator.
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

class CompileError : public Error {
  public:
    explicit CompileError(const std::string& message)
        : Error(ErrorKind::Compile, message) {}
};

class EvalError : public Error {
  public:
    explicit EvalError(const std::string& message)
        : Error(ErrorKind::Eval, message) {}
};

class RecursionError : public Error {
  public:
    explicit RecursionError(const std::string& message)
        : Error(ErrorKind::Recursion, message) {}
};

inline const char* kindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Compile:
        return "Compile";
    case ErrorKind::Eval:
        return "Eval";
    case ErrorKind::Recursion:
        return "Recursion";
    }
    return "Unknown";
}

} // namespace memocalc
