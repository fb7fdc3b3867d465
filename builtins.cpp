#include "context.hpp"
#include "error.hpp"
#include "function.hpp"

#include <random>
#include <string>
#include <utility>
#include <vector>

#include <boost/math/constants/constants.hpp>
#include <boost/math/special_functions/gamma.hpp>

namespace memocalc {

namespace {

namespace mp = boost::multiprecision;

using Args = std::vector<Complex>;

// Largest digit count accepted by pi[n] and e[n].
constexpr unsigned kMaxConstantDigits = 10000;

struct Builtin {
    const char* name;
    std::size_t arity;
    Restriction restriction;
    const char* docs;
    BuiltinFunction::Impl impl;
};

Complex realValue(const Real& value) {
    return makeComplex(value, Real(0));
}

Real pi() {
    Real value = boost::math::constants::pi<Real>();
    return value;
}

void requireNonZero(const std::string& name, const Complex& value) {
    if (isZero(value)) {
        throw EvalError("function \"" + name + "\" is undefined at zero");
    }
}

// Throws when `value` equals re + im*i, a pole of the function.
void requireNotAt(const std::string& name, const Complex& value, int re,
                  int im) {
    if (value.real() == re && value.imag() == im) {
        throw EvalError("function \"" + name + "\" is undefined at " +
                        formatComplex(makeComplex(Real(re), Real(im)),
                                      kDefaultPrecision));
    }
}

void requireNonNegative(const std::string& name, const Real& value) {
    if (value < 0) {
        throw EvalError("function \"" + name +
                        "\" requires non-negative integer argument(s)");
    }
}

unsigned requireDigits(const std::string& name, const Complex& value) {
    Real digits = value.real();
    if (digits < 1) {
        throw EvalError("function \"" + name +
                        "\" requires a positive number of digits");
    }
    if (digits > kMaxConstantDigits) {
        throw EvalError("function \"" + name + "\" is limited to " +
                        std::to_string(kMaxConstantDigits) + " digits");
    }
    return digits.convert_to<unsigned>();
}

Real randomFraction(Context& context) {
    unsigned digits = displayDigits(context.precision());
    std::uniform_int_distribution<int> digit(0, 9);
    std::string text = "0.";
    for (unsigned i = 0; i < digits; ++i) {
        text.push_back(static_cast<char>('0' + digit(context.random())));
    }
    return Real(text.c_str());
}

Complex choose(const Real& n, const Real& k) {
    if (k > n) {
        return Complex(0);
    }
    Real smaller = (n - k < k) ? Real(n - k) : k;
    Real result = 1;
    for (Real i = 1; i <= smaller; i = i + 1) {
        result = result * (n - smaller + i) / i;
    }
    return realValue(mp::round(result));
}

Complex permute(const Real& n, const Real& k) {
    if (k > n) {
        return Complex(0);
    }
    Real result = 1;
    for (Real i = n - k + 1; i <= n; i = i + 1) {
        result = result * i;
    }
    return realValue(result);
}

std::vector<Builtin> builtinTable() {
    std::vector<Builtin> table{
        {"sin", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::sin(a[0]); }},
        {"cos", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::cos(a[0]); }},
        {"tan", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::tan(a[0]); }},
        {"asin", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::asin(a[0]); }},
        {"acos", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::acos(a[0]); }},
        {"atan", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex {
             requireNotAt("atan", a[0], 0, 1);
             requireNotAt("atan", a[0], 0, -1);
             return mp::atan(a[0]);
         }},
        {"sinh", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::sinh(a[0]); }},
        {"cosh", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::cosh(a[0]); }},
        {"tanh", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::tanh(a[0]); }},
        {"asinh", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::asinh(a[0]); }},
        {"acosh", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::acosh(a[0]); }},
        {"atanh", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex {
             requireNotAt("atanh", a[0], 1, 0);
             requireNotAt("atanh", a[0], -1, 0);
             return mp::atanh(a[0]);
         }},
        {"sqrt", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::sqrt(a[0]); }},
        {"exp", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex { return mp::exp(a[0]); }},
        {"abs", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex {
             Real magnitude = mp::abs(a[0]);
             return realValue(magnitude);
         }},
        {"ln", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex {
             requireNonZero("ln", a[0]);
             return mp::log(a[0]);
         }},
        {"log10", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex {
             requireNonZero("log10", a[0]);
             return mp::log10(a[0]);
         }},
        {"log", 2, Restriction::Real, "log[base, x]",
         [](const Args& a, Context&) -> Complex {
             requireNonZero("log", a[0]);
             requireNonZero("log", a[1]);
             Complex base = mp::log(a[0]);
             Complex value = mp::log(a[1]);
             return divide(value, base);
         }},
        {"sinc", 1, Restriction::None, "",
         [](const Args& a, Context&) -> Complex {
             if (isZero(a[0])) {
                 return Complex(1);
             }
             Complex sine = mp::sin(a[0]);
             return divide(sine, a[0]);
         }},
        {"conj", 1, Restriction::None, "complex conjugate",
         [](const Args& a, Context&) -> Complex {
             Real imag = a[0].imag();
             return makeComplex(a[0].real(), Real(-imag));
         }},
        {"re", 1, Restriction::None, "real part",
         [](const Args& a, Context&) -> Complex {
             return realValue(a[0].real());
         }},
        {"im", 1, Restriction::None, "imaginary part",
         [](const Args& a, Context&) -> Complex {
             return realValue(a[0].imag());
         }},
        {"int", 1, Restriction::None, "truncate decimal",
         [](const Args& a, Context&) -> Complex {
             Real whole = mp::trunc(a[0].real());
             return realValue(whole);
         }},
        {"min", 2, Restriction::Real, "",
         [](const Args& a, Context&) -> Complex {
             return a[0].real() <= a[1].real() ? a[0] : a[1];
         }},
        {"max", 2, Restriction::Real, "",
         [](const Args& a, Context&) -> Complex {
             return a[0].real() >= a[1].real() ? a[0] : a[1];
         }},
        {"sign", 1, Restriction::Real,
         "-1 if negative, 1 if positive, 0 if zero",
         [](const Args& a, Context&) -> Complex {
             Real value = a[0].real();
             if (value > 0) {
                 return Complex(1);
             }
             if (value < 0) {
                 return Complex(-1);
             }
             return Complex(0);
         }},
        {"gamma", 1, Restriction::Real,
         "to calculate n! for positive int n, do gamma[n+1]",
         [](const Args& a, Context&) -> Complex {
             if (isInteger(a[0]) && a[0].real() <= 0) {
                 throw EvalError("function \"gamma\" is undefined at "
                                 "non-positive integers");
             }
             Real value = boost::math::tgamma(Real(a[0].real()));
             return realValue(value);
         }},
        {"rad", 1, Restriction::Real, "convert degrees to radians",
         [](const Args& a, Context&) -> Complex {
             Real radians = a[0].real() * pi() / 180;
             return realValue(radians);
         }},
        {"deg", 1, Restriction::Real, "convert radians to degrees",
         [](const Args& a, Context&) -> Complex {
             Real degrees = a[0].real() * 180 / pi();
             return realValue(degrees);
         }},
        {"ceil", 1, Restriction::Real, "",
         [](const Args& a, Context&) -> Complex {
             Real value = mp::ceil(a[0].real());
             return realValue(value);
         }},
        {"floor", 1, Restriction::Real, "",
         [](const Args& a, Context&) -> Complex {
             Real value = mp::floor(a[0].real());
             return realValue(value);
         }},
        {"pi", 1, Restriction::Integer, "calculates pi to number of digits",
         [](const Args& a, Context&) -> Complex {
             PrecisionScope scope(requireDigits("pi", a[0]));
             Real value = boost::math::constants::pi<Real>();
             return realValue(value);
         }},
        {"e", 1, Restriction::Integer, "calculates e to number of digits",
         [](const Args& a, Context&) -> Complex {
             PrecisionScope scope(requireDigits("e", a[0]));
             Real value = boost::math::constants::e<Real>();
             return realValue(value);
         }},
        {"rand", 0, Restriction::None, "random number between 0 and 1",
         [](const Args&, Context& context) -> Complex {
             return realValue(randomFraction(context));
         }},
        {"randint", 2, Restriction::Integer,
         "random integer between a and b inclusive",
         [](const Args& a, Context& context) -> Complex {
             Real low = a[0].real();
             Real high = a[1].real();
             if (low > high) {
                 std::swap(low, high);
             }
             Real range = high - low + 1;
             Real offset = mp::floor(Real(randomFraction(context) * range));
             Real value = low + offset;
             return realValue(value);
         }},
        {"choose", 2, Restriction::Integer, "n choose k",
         [](const Args& a, Context&) -> Complex {
             requireNonNegative("choose", a[0].real());
             requireNonNegative("choose", a[1].real());
             return choose(a[0].real(), a[1].real());
         }},
        {"perm", 2, Restriction::Integer, "n permute k",
         [](const Args& a, Context&) -> Complex {
             requireNonNegative("perm", a[0].real());
             requireNonNegative("perm", a[1].real());
             return permute(a[0].real(), a[1].real());
         }},
        // Evaluated by the evaluator before the counter is bound.
        {"sum", 4, Restriction::None,
         "summation of `_3` for `_0` = `_1` to `_2` inclusive, e.g., "
         "sum[x, 1, 10, x^2]",
         nullptr},
        {"prod", 4, Restriction::None,
         "product of `_3` for `_0` = `_1` to `_2` inclusive, e.g., "
         "prod[x, 1, 10, x^2]",
         nullptr},
    };
    return table;
}

} // namespace

void installBuiltins(Context& context) {
    for (Builtin& entry : builtinTable()) {
        context.setFunction(std::make_shared<BuiltinFunction>(
            entry.name, entry.arity, entry.restriction, entry.docs,
            std::move(entry.impl)));
    }
}

const std::set<std::string>& builtinNames() {
    static const std::set<std::string> names = [] {
        std::set<std::string> out;
        for (const Builtin& entry : builtinTable()) {
            out.insert(entry.name);
        }
        return out;
    }();
    return names;
}

} // namespace memocalc
