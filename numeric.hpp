#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/multiprecision/complex_adaptor.hpp>
#include <boost/multiprecision/gmp.hpp>

#include "error.hpp"

namespace memocalc {

// GMP floats with a runtime precision shared by every value created after
// setWorkingPrecision().
using Real = boost::multiprecision::mpf_float;
using Complex = boost::multiprecision::number<
    boost::multiprecision::complex_adaptor<boost::multiprecision::gmp_float<0>>>;

constexpr long kAutoPrecision = -1;
constexpr long kDefaultPrecision = 32;
constexpr unsigned kAutoDigits = 100;
constexpr unsigned kGuardDigits = 8;

// Number of significant digits printed for a precision setting.
unsigned displayDigits(long precision);
void setWorkingPrecision(long precision);

// Restores the previous working precision on destruction.
class PrecisionScope {
  public:
    explicit PrecisionScope(unsigned digits);
    ~PrecisionScope();

    PrecisionScope(const PrecisionScope&) = delete;
    PrecisionScope& operator=(const PrecisionScope&) = delete;

  private:
    unsigned saved_;
};

Complex makeComplex(const Real& real, const Real& imag);
Complex parseNumeral(const std::string& text);

bool isZero(const Complex& c);
bool isReal(const Complex& c);
bool isInteger(const Complex& c);

Complex add(const Complex& a, const Complex& b);
Complex subtract(const Complex& a, const Complex& b);
Complex multiply(const Complex& a, const Complex& b);
Complex divide(const Complex& a, const Complex& b);
Complex power(const Complex& base, const Complex& exponent);
Complex remainder(const Complex& a, const Complex& b);

struct ComplexLess {
    bool operator()(const Complex& a, const Complex& b) const;
};

// Text of a library exception without Boost's "Error in function <signature>: "
// prefix.
std::string libraryMessage(const std::exception& ex);

// Runs a numeric computation, reporting library failures as EvalError.
template <class Compute>
Complex guardNumeric(const std::string& what, Compute compute) {
    try {
        return compute();
    } catch (const Error&) {
        throw;
    } catch (const std::domain_error& ex) {
        throw EvalError(what + ": " + libraryMessage(ex));
    } catch (const std::runtime_error& ex) {
        throw EvalError(what + ": " + libraryMessage(ex));
    }
}

std::string formatReal(const Real& value, long precision);
std::string formatComplex(const Complex& value, long precision);

} // namespace memocalc
