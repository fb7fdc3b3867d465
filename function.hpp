#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "numeric.hpp"
#include "token.hpp"

namespace memocalc {

class Context;

// Maps argument lists of one fixed length to values, one trie level per
// argument position.
class ArgumentTrie {
  public:
    using Visitor =
        std::function<void(const std::vector<Complex>&, const Complex&)>;

    const Complex* find(const std::vector<Complex>& args) const;
    void insert(const std::vector<Complex>& args, const Complex& value);
    void clear();

    bool empty() const {
        return size_ == 0;
    }

    std::size_t size() const {
        return size_;
    }

    // Visits every stored entry in ascending argument order.
    void forEach(const Visitor& visitor) const;

  private:
    struct Node {
        std::optional<Complex> value;
        std::map<Complex, std::unique_ptr<Node>, ComplexLess> children;
    };

    static void walk(const Node& node, std::vector<Complex>& prefix,
                     const Visitor& visitor);

    Node root_;
    std::size_t size_ = 0;
};

class Function {
  public:
    explicit Function(std::string name)
        : name_(std::move(name)) {}
    virtual ~Function() = default;

    const std::string& name() const {
        return name_;
    }

    virtual std::size_t arity() const = 0;
    virtual Complex call(const std::vector<Complex>& args,
                         Context& context) = 0;

    // Global names the result may depend on.
    virtual const std::set<std::string>& references() const = 0;

    virtual void clearCache() {}

    // One or more lines for the environment listing.
    virtual std::string describe(long precision) const = 0;

  protected:
    void checkArity(std::size_t count) const;

  private:
    std::string name_;
};

using FunctionPtr = std::shared_ptr<Function>;

class UserFunction : public Function {
  public:
    // A function without a body answers only from its base cases.
    UserFunction(std::string name, std::vector<std::string> parameters,
                 std::optional<Operand> body);

    std::size_t arity() const override {
        return parameters_.size();
    }

    Complex call(const std::vector<Complex>& args, Context& context) override;

    const std::set<std::string>& references() const override {
        return references_;
    }

    void clearCache() override {
        cache_.clear();
    }

    std::string describe(long precision) const override;

    void addBaseCase(const std::vector<Complex>& args, const Complex& value);

    // Copies the base cases of an earlier definition of the same arity.
    void adoptBaseCases(const UserFunction& previous);

    const ArgumentTrie& baseCases() const {
        return baseCases_;
    }

    const ArgumentTrie& cache() const {
        return cache_;
    }

  private:
    std::vector<std::string> parameters_;
    std::optional<Operand> body_;
    std::set<std::string> references_;
    ArgumentTrie baseCases_;
    ArgumentTrie cache_;
};

enum class Restriction { None, Real, Integer };

class BuiltinFunction : public Function {
  public:
    using Impl =
        std::function<Complex(const std::vector<Complex>&, Context&)>;

    BuiltinFunction(std::string name, std::size_t arity,
                    Restriction restriction, std::string docs, Impl impl);

    std::size_t arity() const override {
        return arity_;
    }

    Complex call(const std::vector<Complex>& args, Context& context) override;

    const std::set<std::string>& references() const override {
        return references_;
    }

    std::string describe(long precision) const override;

  private:
    std::size_t arity_;
    Restriction restriction_;
    std::string docs_;
    Impl impl_;
    std::set<std::string> references_;
};

// Registers sin, cos, gamma, sum, prod and the rest of the builtin table.
void installBuiltins(Context& context);
const std::set<std::string>& builtinNames();

} // namespace memocalc
