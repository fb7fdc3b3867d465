#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "numeric.hpp"

namespace memocalc {

class Function;

struct Settings {
    long precision = kDefaultPrecision;
    std::size_t maxDepth = kDefaultMaxDepth;
};

// Process-wide evaluation state: global variables, global functions and the
// numeric precision. Function parameters are bound directly in the variable
// map for the duration of a call (see BindingScope).
class Context {
  public:
    explicit Context(Settings settings = Settings());

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const Complex* findVariable(const std::string& name) const;
    bool hasVariable(const std::string& name) const;
    void setVariable(const std::string& name, const Complex& value);
    bool eraseVariable(const std::string& name);

    std::shared_ptr<Function> findFunction(const std::string& name) const;
    void setFunction(std::shared_ptr<Function> function);
    bool eraseFunction(const std::string& name);

    const std::map<std::string, Complex>& variables() const {
        return variables_;
    }

    const std::map<std::string, std::shared_ptr<Function>>& functions() const {
        return functions_;
    }

    long precision() const {
        return precision_;
    }

    // Applies to values created afterwards; recomputes the constants and
    // clears every function cache.
    void setPrecision(long precision);

    std::size_t maxDepth() const {
        return maxDepth_;
    }

    std::size_t depth() const {
        return depth_;
    }

    // Clears the cache of every function that references `name`, then of
    // every function referencing a function whose cache was cleared.
    void invalidate(const std::string& name);
    void invalidateAll();

    // Removes every user-defined variable and function.
    void reset();

    std::mt19937_64& random() {
        return random_;
    }

    static bool isReservedCommand(const std::string& name);
    static bool isReservedVariable(const std::string& name);
    static bool isReservedFunction(const std::string& name);

  private:
    friend class DepthGuard;

    void setConstants();

    std::map<std::string, Complex> variables_;
    std::map<std::string, std::shared_ptr<Function>> functions_;
    long precision_;
    std::size_t maxDepth_;
    std::size_t depth_ = 0;
    std::mt19937_64 random_;
};

// Binds names in the global variable map and restores the previous bindings,
// in reverse order, when the scope ends.
class BindingScope {
  public:
    explicit BindingScope(Context& context)
        : context_(context) {}
    ~BindingScope();

    BindingScope(const BindingScope&) = delete;
    BindingScope& operator=(const BindingScope&) = delete;

    void bind(const std::string& name, const Complex& value);

  private:
    Context& context_;
    std::vector<std::pair<std::string, std::optional<Complex>>> saved_;
};

class DepthGuard {
  public:
    explicit DepthGuard(Context& context);
    ~DepthGuard();

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

  private:
    Context& context_;
};

} // namespace memocalc
