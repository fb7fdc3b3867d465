#include "context.hpp"

#include "error.hpp"
#include "function.hpp"

#include <algorithm>
#include <set>

#include <boost/math/constants/constants.hpp>

namespace memocalc {

namespace {

const char* const kCommands[] = {"reset", "exit", "help",
                                 "env",   "del",  "precision"};
const char* const kConstants[] = {"i", "pi", "e", "ans"};

} // namespace

Context::Context(Settings settings)
    : precision_(settings.precision)
    , maxDepth_(settings.maxDepth)
    , random_(std::random_device{}()) {
    setWorkingPrecision(precision_);
    setConstants();
    variables_["ans"] = Complex(0);
    installBuiltins(*this);
}

const Complex* Context::findVariable(const std::string& name) const {
    auto it = variables_.find(name);
    return it == variables_.end() ? nullptr : &it->second;
}

bool Context::hasVariable(const std::string& name) const {
    return variables_.count(name) != 0;
}

void Context::setVariable(const std::string& name, const Complex& value) {
    variables_[name] = value;
}

bool Context::eraseVariable(const std::string& name) {
    return variables_.erase(name) != 0;
}

std::shared_ptr<Function> Context::findFunction(const std::string& name) const {
    auto it = functions_.find(name);
    return it == functions_.end() ? nullptr : it->second;
}

void Context::setFunction(std::shared_ptr<Function> function) {
    std::string name = function->name();
    functions_[name] = std::move(function);
}

bool Context::eraseFunction(const std::string& name) {
    return functions_.erase(name) != 0;
}

void Context::setPrecision(long precision) {
    precision_ = precision;
    setWorkingPrecision(precision_);
    setConstants();
    invalidateAll();
}

void Context::setConstants() {
    variables_["i"] = makeComplex(Real(0), Real(1));
    Real pi = boost::math::constants::pi<Real>();
    Real e = boost::math::constants::e<Real>();
    variables_["pi"] = makeComplex(pi, Real(0));
    variables_["e"] = makeComplex(e, Real(0));
}

void Context::invalidate(const std::string& name) {
    std::vector<std::string> pending{name};
    std::set<std::string> seen{name};
    while (!pending.empty()) {
        std::string changed = std::move(pending.back());
        pending.pop_back();
        for (const auto& [fname, function] : functions_) {
            if (function->references().count(changed) == 0) {
                continue;
            }
            function->clearCache();
            if (seen.insert(fname).second) {
                pending.push_back(fname);
            }
        }
    }
}

void Context::invalidateAll() {
    for (const auto& entry : functions_) {
        entry.second->clearCache();
    }
}

void Context::reset() {
    for (auto it = variables_.begin(); it != variables_.end();) {
        if (isReservedVariable(it->first)) {
            ++it;
        } else {
            it = variables_.erase(it);
        }
    }
    for (auto it = functions_.begin(); it != functions_.end();) {
        if (isReservedFunction(it->first)) {
            ++it;
        } else {
            it = functions_.erase(it);
        }
    }
    invalidateAll();
}

bool Context::isReservedCommand(const std::string& name) {
    return std::find(std::begin(kCommands), std::end(kCommands), name) !=
           std::end(kCommands);
}

bool Context::isReservedVariable(const std::string& name) {
    return std::find(std::begin(kConstants), std::end(kConstants), name) !=
           std::end(kConstants);
}

bool Context::isReservedFunction(const std::string& name) {
    const std::set<std::string>& names = builtinNames();
    return names.count(name) != 0;
}

BindingScope::~BindingScope() {
    for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
        if (it->second) {
            context_.setVariable(it->first, *it->second);
        } else {
            context_.eraseVariable(it->first);
        }
    }
}

void BindingScope::bind(const std::string& name, const Complex& value) {
    const Complex* previous = context_.findVariable(name);
    saved_.emplace_back(name, previous ? std::optional<Complex>(*previous)
                                       : std::nullopt);
    context_.setVariable(name, value);
}

DepthGuard::DepthGuard(Context& context)
    : context_(context) {
    if (context_.depth_ >= context_.maxDepth_) {
        throw RecursionError("function recursion too deep");
    }
    ++context_.depth_;
}

DepthGuard::~DepthGuard() {
    --context_.depth_;
}

} // namespace memocalc
