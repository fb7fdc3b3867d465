#include "numeric.hpp"

#include "error.hpp"

#include <cctype>

#include <gmp.h>

namespace memocalc {

namespace mp = boost::multiprecision;

unsigned displayDigits(long precision) {
    if (precision == kAutoPrecision) {
        return kAutoDigits;
    }
    return static_cast<unsigned>(precision);
}

void setWorkingPrecision(long precision) {
    Real::default_precision(displayDigits(precision) + kGuardDigits);
}

PrecisionScope::PrecisionScope(unsigned digits)
    : saved_(Real::default_precision()) {
    Real::default_precision(digits + kGuardDigits);
}

PrecisionScope::~PrecisionScope() {
    Real::default_precision(saved_);
}

Complex makeComplex(const Real& real, const Real& imag) {
    return Complex(real, imag);
}

Complex parseNumeral(const std::string& text) {
    std::string digits = text;
    bool imaginary = false;
    if (!digits.empty() && digits.back() == 'i') {
        digits.pop_back();
        imaginary = true;
    }
    // GMP wants a digit after the radix point ("2." and "2.e3").
    std::size_t dot = digits.find('.');
    if (dot != std::string::npos &&
        (dot + 1 == digits.size() || !std::isdigit(digits[dot + 1]))) {
        digits.insert(dot + 1, "0");
    }
    Real part;
    try {
        part = Real(digits.c_str());
    } catch (const std::runtime_error&) {
        throw CompileError("\"" + text + "\" is not a valid numeral");
    }
    if (imaginary) {
        return makeComplex(Real(0), part);
    }
    return makeComplex(part, Real(0));
}

bool isZero(const Complex& c) {
    return c.real() == 0 && c.imag() == 0;
}

bool isReal(const Complex& c) {
    return c.imag() == 0;
}

bool isInteger(const Complex& c) {
    if (!isReal(c)) {
        return false;
    }
    Real re = c.real();
    Real whole = mp::trunc(re);
    return whole == re;
}

Complex add(const Complex& a, const Complex& b) {
    Complex result = a + b;
    return result;
}

Complex subtract(const Complex& a, const Complex& b) {
    Complex result = a - b;
    return result;
}

Complex multiply(const Complex& a, const Complex& b) {
    Complex result = a * b;
    return result;
}

Complex divide(const Complex& a, const Complex& b) {
    if (isZero(b)) {
        throw EvalError("Division by zero.");
    }
    Complex result = a / b;
    return result;
}

namespace {

Complex powInteger(const Complex& base, const Real& exponent) {
    if (exponent == 0) {
        return Complex(1);
    }
    if (exponent == 1) {
        return base;
    }
    if (exponent == -1) {
        return divide(Complex(1), base);
    }
    Real half = mp::trunc(Real(exponent / 2));
    Complex root = powInteger(base, half);
    Complex result = multiply(root, root);
    Real rest = exponent - half * 2;
    if (rest == 1) {
        result = multiply(result, base);
    } else if (rest == -1) {
        result = divide(result, base);
    }
    return result;
}

} // namespace

Complex power(const Complex& base, const Complex& exponent) {
    if (isInteger(exponent)) {
        return powInteger(base, exponent.real());
    }
    if (isZero(base)) {
        if (exponent.real() > 0) {
            return Complex(0);
        }
        throw EvalError("Division by zero.");
    }
    Complex result = mp::pow(base, exponent);
    return result;
}

Complex remainder(const Complex& a, const Complex& b) {
    if (!isReal(a) || !isReal(b)) {
        throw EvalError("cannot apply remainder operator to complex numbers.");
    }
    Real divisor = b.real();
    if (divisor == 0) {
        throw EvalError("Division by zero.");
    }
    Real result = mp::fmod(a.real(), divisor);
    return makeComplex(result, Real(0));
}

bool ComplexLess::operator()(const Complex& a, const Complex& b) const {
    Real ar = a.real();
    Real br = b.real();
    if (ar != br) {
        return ar < br;
    }
    Real ai = a.imag();
    Real bi = b.imag();
    return ai < bi;
}

std::string libraryMessage(const std::exception& ex) {
    static const std::string prefix = "Error in function ";
    std::string text = ex.what();
    if (text.compare(0, prefix.size(), prefix) != 0) {
        return text;
    }
    std::size_t colon = text.find(": ", prefix.size());
    if (colon == std::string::npos) {
        return text;
    }
    return text.substr(colon + 2);
}

std::string formatReal(const Real& value, long precision) {
    if (value == 0) {
        return "0";
    }
    unsigned digits = displayDigits(precision);
    std::vector<char> buffer(digits + 2);
    mp_exp_t exponent = 0;
    mpf_get_str(buffer.data(), &exponent, 10, digits, value.backend().data());

    std::string mantissa(buffer.data());
    bool negative = false;
    if (!mantissa.empty() && mantissa.front() == '-') {
        negative = true;
        mantissa.erase(0, 1);
    }
    while (mantissa.size() > 1 && mantissa.back() == '0') {
        mantissa.pop_back();
    }

    // value == 0.<mantissa> * 10^exponent
    long size = static_cast<long>(mantissa.size());
    bool plain = precision != kAutoPrecision && exponent >= -3 && exponent <= 6;
    std::string out = negative ? "-" : "";
    if (plain) {
        if (exponent <= 0) {
            out += "0." + std::string(static_cast<std::size_t>(-exponent), '0') +
                   mantissa;
        } else if (exponent >= size) {
            out += mantissa +
                   std::string(static_cast<std::size_t>(exponent - size), '0');
        } else {
            out += mantissa.substr(0, static_cast<std::size_t>(exponent)) + "." +
                   mantissa.substr(static_cast<std::size_t>(exponent));
        }
        return out;
    }
    out += mantissa.substr(0, 1);
    if (size > 1) {
        out += "." + mantissa.substr(1);
    }
    out += "e" + std::to_string(static_cast<long>(exponent) - 1);
    return out;
}

std::string formatComplex(const Complex& value, long precision) {
    Real re = value.real();
    Real im = value.imag();
    if (im == 0) {
        return formatReal(re, precision);
    }

    std::string imaginary;
    if (im == 1) {
        imaginary = "i";
    } else if (im == -1) {
        imaginary = "-i";
    } else {
        imaginary = formatReal(im, precision) + "i";
    }
    if (re == 0) {
        return imaginary;
    }
    return formatReal(re, precision) + (im > 0 ? "+" : "") + imaginary;
}

} // namespace memocalc
