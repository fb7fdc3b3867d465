#include <gtest/gtest.h>

#include <memory>

#include "calculator.hpp"
#include "function.hpp"

namespace memocalc {
namespace {

class FunctionTest : public ::testing::Test {
  protected:
    std::string run(const std::string& line) {
        ExecResult result = calculator_.execute(line);
        EXPECT_TRUE(result.ok()) << line << " -> " << result.output;
        return result.output;
    }

    ExecResult fail(const std::string& line) {
        ExecResult result = calculator_.execute(line);
        EXPECT_FALSE(result.ok()) << line << " -> " << result.output;
        return result;
    }

    std::shared_ptr<UserFunction> user(const std::string& name) {
        return std::dynamic_pointer_cast<UserFunction>(
            calculator_.context().findFunction(name));
    }

    Calculator calculator_;
};

TEST(ArgumentTrieTest, FindsOnlyCompleteArgumentLists) {
    setWorkingPrecision(kDefaultPrecision);
    ArgumentTrie trie;
    trie.insert({parseNumeral("1"), parseNumeral("2")}, parseNumeral("3"));
    trie.insert({parseNumeral("1"), parseNumeral("4")}, parseNumeral("5"));
    EXPECT_EQ(trie.size(), 2u);

    const Complex* hit = trie.find({parseNumeral("1"), parseNumeral("2")});
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(formatComplex(*hit, 32), "3");
    EXPECT_EQ(trie.find({parseNumeral("1")}), nullptr);
    EXPECT_EQ(trie.find({parseNumeral("2"), parseNumeral("1")}), nullptr);

    trie.insert({parseNumeral("1"), parseNumeral("2")}, parseNumeral("7"));
    EXPECT_EQ(trie.size(), 2u);
    EXPECT_EQ(formatComplex(*trie.find({parseNumeral("1"), parseNumeral("2")}),
                            32),
              "7");

    trie.clear();
    EXPECT_TRUE(trie.empty());
    EXPECT_EQ(trie.find({parseNumeral("1"), parseNumeral("4")}), nullptr);
}

TEST(ArgumentTrieTest, KeysAreNumericValues) {
    setWorkingPrecision(kDefaultPrecision);
    ArgumentTrie trie;
    trie.insert({parseNumeral("2")}, parseNumeral("1"));
    EXPECT_NE(trie.find({parseNumeral("2.0")}), nullptr);
    EXPECT_EQ(trie.find({parseNumeral("2i")}), nullptr);
}

TEST_F(FunctionTest, FactorialWithBaseCaseFirst) {
    run("f[0] = 1");
    run("f[n] = n*f[n-1]");
    EXPECT_EQ(run("f[5]"), "120");
}

TEST_F(FunctionTest, FactorialWithBodyFirst) {
    run("f[n] = n*f[n-1]");
    run("f[0] = 1");
    EXPECT_EQ(run("f[5]"), "120");
}

TEST_F(FunctionTest, ResultsAreCachedPerArgumentList) {
    run("f[0] = 1");
    run("f[n] = n*f[n-1]");
    run("f[5]");
    EXPECT_EQ(user("f")->cache().size(), 5u);
    EXPECT_EQ(run("f[5]"), "120");
    EXPECT_EQ(user("f")->cache().size(), 5u);
}

TEST_F(FunctionTest, ChangingAReferencedVariableClearsTheCache) {
    run("y = 2");
    run("g[x] = x*y");
    EXPECT_EQ(run("g[3]"), "6");
    EXPECT_EQ(user("g")->cache().size(), 1u);
    run("y = 5");
    EXPECT_TRUE(user("g")->cache().empty());
    EXPECT_EQ(run("g[3]"), "15");
}

TEST_F(FunctionTest, UnrelatedVariablesKeepTheCache) {
    run("y = 2");
    run("g[x] = x*y");
    run("g[3]");
    run("z = 1");
    EXPECT_EQ(user("g")->cache().size(), 1u);
}

TEST_F(FunctionTest, InvalidationReachesCallersOfCallers) {
    run("y = 1");
    run("f[x] = x+y");
    run("h[x] = f[x]*2");
    EXPECT_EQ(run("h[1]"), "4");
    run("y = 2");
    EXPECT_EQ(run("h[1]"), "6");
}

TEST_F(FunctionTest, RedefiningACalleeClearsCallerCaches) {
    run("f[x] = x+1");
    run("h[x] = f[x]*2");
    EXPECT_EQ(run("h[1]"), "4");
    run("f[x] = x+2");
    EXPECT_EQ(run("h[1]"), "6");
}

TEST_F(FunctionTest, ParametersShadowOnlyDuringTheCall) {
    run("g[t] = t*2");
    EXPECT_EQ(run("g[4]"), "8");
    EXPECT_FALSE(calculator_.context().hasVariable("t"));
}

TEST_F(FunctionTest, ParametersAreRestoredAfterAFailedCall) {
    run("g[t] = t/0");
    fail("g[4]");
    EXPECT_FALSE(calculator_.context().hasVariable("t"));
}

TEST_F(FunctionTest, MultiArgumentBaseCases) {
    run("g[0,0] = 2");
    run("g[a,b] = g[a-1,b]+1");
    EXPECT_EQ(run("g[2,0]"), "4");
}

TEST_F(FunctionTest, ZeroArgumentFunction) {
    run("g[] = 3");
    EXPECT_EQ(run("g[]*2"), "6");
}

TEST_F(FunctionTest, CallArityMismatch) {
    run("f[x] = x");
    ExecResult result = fail("f[1,2]");
    EXPECT_EQ(result.error, ErrorKind::Eval);
    EXPECT_NE(result.output.find("takes 1 argument(s)"), std::string::npos);
}

TEST_F(FunctionTest, BaseCaseArityMismatchIsACompileError) {
    run("f[x] = x");
    EXPECT_EQ(fail("f[1,2] = 3").error, ErrorKind::Compile);
}

TEST_F(FunctionTest, ParameterRules) {
    run("x = 1");
    EXPECT_EQ(fail("f[x] = x").error, ErrorKind::Compile);
    EXPECT_EQ(fail("f[a,a] = a").error, ErrorKind::Compile);
    EXPECT_EQ(fail("f[pi] = pi").error, ErrorKind::Compile);
    EXPECT_EQ(fail("sin[a] = a").error, ErrorKind::Compile);
}

TEST_F(FunctionTest, BaseCasesOnlyFunctionFailsForOtherArguments) {
    run("f[0] = 1");
    EXPECT_EQ(run("f[0]"), "1");
    EXPECT_EQ(fail("f[1]").error, ErrorKind::Eval);
}

TEST_F(FunctionTest, RedefinitionWithNewArityDropsBaseCases) {
    run("f[0] = 1");
    run("f[a,b] = a+b");
    EXPECT_TRUE(user("f")->baseCases().empty());
    EXPECT_EQ(fail("f[0]").error, ErrorKind::Eval);
}

TEST_F(FunctionTest, BaseCaseOverridesTheBody) {
    run("f[x] = x^2");
    run("f[3] = 100");
    EXPECT_EQ(run("f[3]"), "100");
    EXPECT_EQ(run("f[4]"), "16");
}

TEST(RecursionTest, RunawayRecursionIsReported) {
    Settings settings;
    settings.maxDepth = 50;
    Calculator calculator(settings);
    ASSERT_TRUE(calculator.execute("f[n] = f[n+1]").ok());

    ExecResult result = calculator.execute("f[1]");
    EXPECT_EQ(result.error, ErrorKind::Recursion);
    EXPECT_EQ(result.output, "Recursion error: function recursion too deep");
    EXPECT_EQ(calculator.context().depth(), 0u);
    EXPECT_FALSE(calculator.context().hasVariable("n"));

    EXPECT_EQ(calculator.execute("1+1").output, "2");
}

TEST(RecursionTest, DeepButBoundedRecursionSucceeds) {
    Calculator calculator;
    calculator.execute("f[0] = 0");
    calculator.execute("f[n] = f[n-1]+1");
    ExecResult result = calculator.execute("f[300]");
    EXPECT_TRUE(result.ok()) << result.output;
    EXPECT_EQ(result.output, "300");
}

} // namespace
} // namespace memocalc
