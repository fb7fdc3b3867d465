#include "function.hpp"

#include "context.hpp"
#include "error.hpp"
#include "evaluator.hpp"

namespace memocalc {

const Complex* ArgumentTrie::find(const std::vector<Complex>& args) const {
    const Node* node = &root_;
    for (const Complex& arg : args) {
        auto it = node->children.find(arg);
        if (it == node->children.end()) {
            return nullptr;
        }
        node = it->second.get();
    }
    return node->value ? &*node->value : nullptr;
}

void ArgumentTrie::insert(const std::vector<Complex>& args,
                          const Complex& value) {
    Node* node = &root_;
    for (const Complex& arg : args) {
        std::unique_ptr<Node>& child = node->children[arg];
        if (!child) {
            child = std::make_unique<Node>();
        }
        node = child.get();
    }
    if (!node->value) {
        ++size_;
    }
    node->value = value;
}

void ArgumentTrie::clear() {
    root_.value.reset();
    root_.children.clear();
    size_ = 0;
}

void ArgumentTrie::forEach(const Visitor& visitor) const {
    std::vector<Complex> prefix;
    walk(root_, prefix, visitor);
}

void ArgumentTrie::walk(const Node& node, std::vector<Complex>& prefix,
                        const Visitor& visitor) {
    if (node.value) {
        visitor(prefix, *node.value);
    }
    for (const auto& [key, child] : node.children) {
        prefix.push_back(key);
        walk(*child, prefix, visitor);
        prefix.pop_back();
    }
}

void Function::checkArity(std::size_t count) const {
    if (count != arity()) {
        throw EvalError("function \"" + name_ + "\" takes " +
                        std::to_string(arity()) + " argument(s) but " +
                        std::to_string(count) + " were given");
    }
}

namespace {

std::string formatArguments(const std::vector<Complex>& args, long precision) {
    std::string out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += formatComplex(args[i], precision);
    }
    return out;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += names[i];
    }
    return out;
}

} // namespace

UserFunction::UserFunction(std::string name,
                           std::vector<std::string> parameters,
                           std::optional<Operand> body)
    : Function(std::move(name))
    , parameters_(std::move(parameters))
    , body_(std::move(body)) {
    if (body_) {
        references_ = memocalc::references(*body_);
        for (const std::string& parameter : parameters_) {
            references_.erase(parameter);
        }
    }
}

Complex UserFunction::call(const std::vector<Complex>& args,
                           Context& context) {
    checkArity(args.size());
    if (const Complex* base = baseCases_.find(args)) {
        return *base;
    }
    if (const Complex* cached = cache_.find(args)) {
        return *cached;
    }
    if (!body_) {
        throw EvalError("function \"" + name() + "\" has no definition for [" +
                        formatArguments(args, context.precision()) + "]");
    }

    Complex result;
    {
        BindingScope scope(context);
        for (std::size_t i = 0; i < parameters_.size(); ++i) {
            scope.bind(parameters_[i], args[i]);
        }
        result = evaluate(*body_, context);
    }
    cache_.insert(args, result);
    return result;
}

void UserFunction::addBaseCase(const std::vector<Complex>& args,
                               const Complex& value) {
    checkArity(args.size());
    baseCases_.insert(args, value);
}

void UserFunction::adoptBaseCases(const UserFunction& previous) {
    previous.baseCases_.forEach(
        [this](const std::vector<Complex>& args, const Complex& value) {
            baseCases_.insert(args, value);
        });
}

std::string UserFunction::describe(long precision) const {
    std::string out = name() + "[" + joinNames(parameters_) + "]";
    if (body_) {
        out += " := " + toString(*body_);
    } else {
        out += " (base cases only)";
    }
    baseCases_.forEach([&](const std::vector<Complex>& args,
                           const Complex& value) {
        out += "\n    " + name() + "[" + formatArguments(args, precision) +
               "] = " + formatComplex(value, precision);
    });
    return out;
}

BuiltinFunction::BuiltinFunction(std::string name, std::size_t arity,
                                 Restriction restriction, std::string docs,
                                 Impl impl)
    : Function(std::move(name))
    , arity_(arity)
    , restriction_(restriction)
    , docs_(std::move(docs))
    , impl_(std::move(impl)) {}

Complex BuiltinFunction::call(const std::vector<Complex>& args,
                              Context& context) {
    checkArity(args.size());
    for (const Complex& arg : args) {
        if (restriction_ == Restriction::Real && !isReal(arg)) {
            throw EvalError("function \"" + name() +
                            "\" requires real argument(s)");
        }
        if (restriction_ == Restriction::Integer && !isInteger(arg)) {
            throw EvalError("function \"" + name() +
                            "\" requires integer argument(s)");
        }
    }
    if (!impl_) {
        throw std::logic_error("INTERNAL ERROR: builtin \"" + name() +
                               "\" has no direct implementation");
    }
    return guardNumeric("function \"" + name() + "\"",
                        [&]() -> Complex { return impl_(args, context); });
}

std::string BuiltinFunction::describe(long) const {
    std::vector<std::string> slots;
    for (std::size_t i = 0; i < arity_; ++i) {
        slots.push_back("_" + std::to_string(i));
    }
    std::string out = name() + "[" + joinNames(slots) + "]";
    if (!docs_.empty()) {
        out += ": " + docs_;
    }
    return out;
}

} // namespace memocalc
