#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "calculator.hpp"
#include "function.hpp"

namespace memocalc {
namespace {

class CalculatorTest : public ::testing::Test {
  protected:
    std::string output(const std::string& line) {
        return calculator_.execute(line).output;
    }

    Calculator calculator_;
};

TEST_F(CalculatorTest, EvaluatesExpressionsAndStoresAnswer) {
    EXPECT_EQ(output("2 + 3"), "5");
    EXPECT_EQ(output("ans * 2"), "10");
    EXPECT_EQ(output("1 2 3"), "123");
}

TEST_F(CalculatorTest, VariableDefinition) {
    EXPECT_EQ(output("x = 2+3"), "x := 5");
    EXPECT_EQ(output("ans"), "5");
    EXPECT_EQ(output("x*x"), "25");
}

TEST_F(CalculatorTest, FunctionDefinitionEchoesTheBody) {
    EXPECT_EQ(output("f[x, y] = x + y"), "f[x, y] := x+y");
    EXPECT_EQ(output("f[2,3]"), "5");
}

TEST_F(CalculatorTest, BaseCaseDefinitionEchoesTheTable) {
    EXPECT_EQ(output("f[0] = 1"), "f[_0] (base cases only)\n    f[0] = 1");
    EXPECT_EQ(output("f[n] = n*f[n-1]"),
              "f[n] := n*f[n-1]\n    f[0] = 1");
}

TEST_F(CalculatorTest, CompileErrorsAreReportedWithTheirKind) {
    ExecResult result = calculator_.execute("1+");
    EXPECT_EQ(result.error, ErrorKind::Compile);
    EXPECT_EQ(result.output,
              "Compile error: not enough operands for the last operator");

    EXPECT_EQ(calculator_.execute(")(").error, ErrorKind::Compile);
    EXPECT_EQ(calculator_.execute("(1+2").error, ErrorKind::Compile);
    EXPECT_EQ(calculator_.execute("2$3").error, ErrorKind::Compile);
    EXPECT_EQ(calculator_.execute("f[1,2").error, ErrorKind::Compile);
}

TEST_F(CalculatorTest, EvalErrorsAreReportedWithTheirKind) {
    ExecResult result = calculator_.execute("5%2i");
    EXPECT_EQ(result.error, ErrorKind::Eval);
    EXPECT_EQ(result.output,
              "Eval error: cannot apply remainder operator to complex numbers.");
    EXPECT_EQ(calculator_.execute("unknown").error, ErrorKind::Eval);
}

TEST_F(CalculatorTest, OverlongInputIsACompileError) {
    ExecResult letters = calculator_.execute(std::string(30000, 'a'));
    EXPECT_EQ(letters.error, ErrorKind::Compile);
    EXPECT_EQ(letters.output,
              "Compile error: input is longer than 4096 characters");
    EXPECT_EQ(calculator_.execute(std::string(30000, '$')).error,
              ErrorKind::Compile);

    std::string deep;
    for (int n = 0; n < 30000; ++n) {
        deep += "sin[";
    }
    deep += "1" + std::string(30000, ']');
    EXPECT_EQ(calculator_.execute(deep).error, ErrorKind::Compile);
}

TEST_F(CalculatorTest, LongIdentifierIsAnUndefinedVariable) {
    EXPECT_EQ(calculator_.execute(std::string(4000, 'a')).error,
              ErrorKind::Eval);
}

TEST_F(CalculatorTest, NestingPastTheDepthLimitIsARecursionError) {
    std::string nested;
    for (std::size_t n = 0; n <= kDefaultMaxDepth; ++n) {
        nested += "f[";
    }
    nested += "1" + std::string(kDefaultMaxDepth + 1, ']');
    ExecResult result = calculator_.execute(nested);
    EXPECT_EQ(result.error, ErrorKind::Recursion);
    EXPECT_EQ(result.output, "Recursion error: function calls nested too deep");
    EXPECT_EQ(output("1+1"), "2");
}

TEST_F(CalculatorTest, GammaPolesAreReportedPlainly) {
    EXPECT_EQ(output("gamma[-1]"),
              "Eval error: function \"gamma\" is undefined at non-positive "
              "integers");
    EXPECT_EQ(output("atanh[1]"),
              "Eval error: function \"atanh\" is undefined at 1");
    EXPECT_EQ(output("atan[-i]"),
              "Eval error: function \"atan\" is undefined at -i");
}

TEST_F(CalculatorTest, FailedDefinitionLeavesStateUntouched) {
    output("x = 1");
    EXPECT_FALSE(calculator_.execute("x = 1/0").ok());
    EXPECT_EQ(output("x"), "1");
}

TEST_F(CalculatorTest, ReservedNamesCannotBeReassigned) {
    ExecResult result = calculator_.execute("pi = 3");
    EXPECT_EQ(result.error, ErrorKind::Compile);
    EXPECT_EQ(calculator_.execute("help = 3").error, ErrorKind::Compile);
    EXPECT_EQ(calculator_.execute("ans = 3").error, ErrorKind::Compile);
}

TEST_F(CalculatorTest, ExitCommand) {
    ExecResult result = calculator_.execute("exit");
    EXPECT_TRUE(result.exit);
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(calculator_.execute("1").exit);
}

TEST_F(CalculatorTest, BlankLineDoesNothing) {
    ExecResult result = calculator_.execute("   ");
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "");
}

TEST_F(CalculatorTest, DeleteCommand) {
    output("x = 1");
    output("f[a] = a");
    EXPECT_EQ(output("del x"), "Deleted variable \"x\"");
    EXPECT_EQ(calculator_.execute("x").error, ErrorKind::Eval);
    EXPECT_EQ(output("del f"), "Deleted function \"f\"");
    EXPECT_EQ(calculator_.execute("f[1]").error, ErrorKind::Eval);
    EXPECT_EQ(output("del pi"), "Cannot delete reserved variable \"pi\"");
    EXPECT_EQ(output("del sin"), "Cannot delete reserved function \"sin\"");
    EXPECT_EQ(output("del nothing"),
              "Variable or function \"nothing\" not found.");
    EXPECT_EQ(output("del"), "Invalid command. Usage: del <name>");
}

TEST_F(CalculatorTest, DeletingAVariableClearsDependentCaches) {
    output("y = 1");
    output("g[x] = x+y");
    EXPECT_EQ(output("g[1]"), "2");
    output("del y");
    EXPECT_EQ(calculator_.execute("g[1]").error, ErrorKind::Eval);
}

TEST_F(CalculatorTest, VariablesStartingWithACommandName) {
    EXPECT_EQ(output("delta = 4"), "delta := 4");
    EXPECT_EQ(output("delta+1"), "5");
}

TEST_F(CalculatorTest, PrecisionCommand) {
    EXPECT_EQ(output("precision"), "Precision is 32 digit(s).");
    EXPECT_EQ(output("precision 5"), "Precision set to 5 digit(s).");
    EXPECT_EQ(output("1/3"), "0.33333");
    EXPECT_EQ(output("precision 0"),
              "Invalid precision value. Must be a positive number.");
    EXPECT_EQ(output("precision abc"),
              "Invalid precision value. Must be a positive number.");
    EXPECT_EQ(output("precision auto"),
              "Precision set to auto (significant figures).");
    EXPECT_EQ(output("1500"), "1.5e3");
}

TEST_F(CalculatorTest, PrecisionChangeClearsCaches) {
    output("f[x] = x/3");
    output("f[1]");
    auto function = std::dynamic_pointer_cast<UserFunction>(
        calculator_.context().findFunction("f"));
    ASSERT_TRUE(function);
    EXPECT_EQ(function->cache().size(), 1u);
    output("precision 10");
    EXPECT_TRUE(function->cache().empty());
    EXPECT_EQ(output("f[1]"), "0.3333333333");
}

TEST_F(CalculatorTest, ResetRemovesUserDefinitions) {
    output("x = 1");
    output("f[a] = a");
    EXPECT_EQ(output("reset"), "All variables and functions have been reset.");
    EXPECT_EQ(calculator_.execute("x").error, ErrorKind::Eval);
    EXPECT_EQ(calculator_.execute("f[1]").error, ErrorKind::Eval);
    EXPECT_EQ(output("sin[0]*0+pi-pi"), "0");
}

TEST_F(CalculatorTest, EnvironmentListing) {
    output("x = 1");
    output("f[0] = 1");
    output("f[a] = a+1");
    std::string listing = output("env");
    EXPECT_NE(listing.find("Global precision: 32 digits"), std::string::npos);
    EXPECT_NE(listing.find("Internal variables:\n  ans = 1"), std::string::npos);
    EXPECT_NE(listing.find("  sin[_0]"), std::string::npos);
    EXPECT_NE(listing.find("  gamma[_0]: to calculate n! for positive int n"),
              std::string::npos);
    EXPECT_NE(listing.find("User-defined variables:\n  x = 1"),
              std::string::npos);
    EXPECT_NE(listing.find("User-defined functions:\n  f[a] := a+1\n      f[0] = 1"),
              std::string::npos);
}

TEST_F(CalculatorTest, HelpText) {
    std::string help = output("help");
    EXPECT_EQ(help, Calculator::helpText());
    EXPECT_NE(help.find("precision auto"), std::string::npos);
}

} // namespace
} // namespace memocalc
