/***
 * Name: test_syntax_fact_extractor
 * Purpose: Parameter, default-value and stored-variable facts from parsed trees.
 */
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "checks/SyntaxFactExtractor.h"
#include "parser/unit/ParseHelpers.h"

using namespace pysca;
using checks::SyntaxFactExtractor;

static checks::SyntaxFacts factsOf(const std::string& src, bool functionScopeOnly = false) {
  auto mod = testutil::parseSrc(src);
  SyntaxFactExtractor ex(functionScopeOnly);
  return ex.extract(*mod);
}

static std::vector<std::string> variableNames(const checks::SyntaxFacts& f) {
  std::vector<std::string> out;
  for (const auto& [name, line] : f.storedVariables()) { out.push_back(name); }
  return out;
}

static const ast::Expr& firstValue(const ast::Module& mod) {
  return *static_cast<const ast::AssignStmt&>(*mod.body.at(0)).value;
}

TEST(SyntaxFactExtractor, PositionalParametersOnly) {
  auto f = factsOf("def f(posOnly, /, reg, *Args, kwOnly, **Kw):\n    pass\n");
  const std::vector<std::pair<int, std::string>> expected{{1, "posOnly"}, {1, "reg"}};
  EXPECT_EQ(f.parameters(), expected);
}

TEST(SyntaxFactExtractor, MethodParametersAndNestedDefs) {
  auto f = factsOf("class A:\n    def m(self, Value):\n        def inner(q):\n            pass\n");
  const std::vector<std::pair<int, std::string>> expected{{2, "self"}, {2, "Value"}, {3, "q"}};
  EXPECT_EQ(f.parameters(), expected);
}

TEST(SyntaxFactExtractor, DecoratedDefUsesDefLine) {
  auto f = factsOf("@decorator\n@other(1)\ndef f(x=[]):\n    pass\n");
  ASSERT_EQ(f.mutableDefaults().size(), 1u);
  EXPECT_EQ(*f.mutableDefaults().begin(), 3);
  ASSERT_EQ(f.parameters().size(), 1u);
  EXPECT_EQ(f.parameters()[0].first, 3);
}

TEST(SyntaxFactExtractor, LiteralDefaultsAreNotMutable) {
  auto f = factsOf("def f(a=1, b=2.5, c='s', d=b'b', e=None, g=True, h=..., i=3j):\n    pass\n");
  EXPECT_TRUE(f.mutableDefaults().empty());
}

TEST(SyntaxFactExtractor, NonLiteralDefaultsAreMutable) {
  auto f = factsOf(
      "def a(x=[]):\n    pass\n"
      "def b(x=(1, 2)):\n    pass\n"
      "def c(x={}):\n    pass\n"
      "def d(x=f'{y}'):\n    pass\n"
      "async def e(x=make()):\n    pass\n"
      "def g(x=CONST):\n    pass\n");
  const std::set<int> expected{1, 3, 5, 7, 9, 11};
  EXPECT_EQ(f.mutableDefaults(), expected);
}

TEST(SyntaxFactExtractor, KeywordOnlyDefaultsIgnored) {
  auto f = factsOf("def f(a, *, x=[], y=make()):\n    pass\n");
  EXPECT_TRUE(f.mutableDefaults().empty());
}

TEST(SyntaxFactExtractor, SignedNumberDefaultIsMutable) {
  auto f = factsOf("def f(x=-1):\n    pass\n");
  const std::set<int> expected{1};
  EXPECT_EQ(f.mutableDefaults(), expected);
}

TEST(SyntaxFactExtractor, LambdaParametersNotRecorded) {
  auto f = factsOf("g = lambda X: X\n");
  EXPECT_TRUE(f.parameters().empty());
}

TEST(SyntaxFactExtractor, LambdaDefaultsIgnored) {
  auto f = factsOf("g = lambda x=[]: x\n");
  EXPECT_TRUE(f.mutableDefaults().empty());
  EXPECT_TRUE(f.parameters().empty());
}

TEST(SyntaxFactExtractor, StoredNamesEverywhereByDefault) {
  auto f = factsOf(
      "TopLevel = 1\n"
      "for Idx in range(3):\n"
      "    pass\n"
      "with open(p) as Handle:\n"
      "    pass\n"
      "if (Walrus := 2):\n"
      "    pass\n"
      "Lhs, *Rest = seq\n"
      "obj.Attr = 3\n"
      "items[Key] = 4\n");
  const std::vector<std::string> expected{"TopLevel", "Idx", "Handle", "Walrus", "Lhs", "Rest"};
  EXPECT_EQ(variableNames(f), expected);
}

TEST(SyntaxFactExtractor, LastBindingLineWins) {
  auto f = factsOf("myVar = 1\nother = 2\nmyVar = 3\n");
  ASSERT_EQ(f.storedVariables().size(), 2u);
  EXPECT_EQ(f.storedVariables()[0], std::make_pair(std::string("myVar"), 3));
}

TEST(SyntaxFactExtractor, FunctionScopeOnlyMode) {
  const std::string src =
      "ModuleVar = 1\n"
      "class K:\n"
      "    ClassVar = 2\n"
      "    def m(self, p=(Dflt := [])):\n"
      "        LocalVar = 3\n"
      "        Fn = lambda: (InLambda := 1)\n"
      "After = 4\n";
  const std::vector<std::string> all{"ModuleVar", "ClassVar", "Dflt", "LocalVar", "Fn", "InLambda", "After"};
  EXPECT_EQ(variableNames(factsOf(src)), all);
  const std::vector<std::string> scoped{"LocalVar", "Fn", "InLambda"};
  EXPECT_EQ(variableNames(factsOf(src, true)), scoped);
}

TEST(SyntaxFactExtractor, TypeAliasNameIsNotAVariable) {
  auto f = factsOf("type MyAlias = list[int]\n");
  EXPECT_TRUE(f.storedVariables().empty());
}

TEST(SyntaxFactExtractor, IsLiteralConstant) {
  auto lit = [](const std::string& expr) {
    auto mod = testutil::parseSrc("v = " + expr + "\n");
    return SyntaxFactExtractor::IsLiteralConstant(firstValue(*mod));
  };
  EXPECT_TRUE(lit("42"));
  EXPECT_FALSE(lit("-1"));
  EXPECT_TRUE(lit("'a' 'b'"));
  EXPECT_TRUE(lit("None"));
  EXPECT_FALSE(lit("-x"));
  EXPECT_FALSE(lit("not True"));
  EXPECT_FALSE(lit("(1,)"));
  EXPECT_FALSE(lit("[]"));
  EXPECT_FALSE(lit("f'x'"));
  EXPECT_FALSE(lit("1 + 2"));
}

TEST(SyntaxFactExtractor, DiagnosticsGroupedVariablesArgumentsDefaults) {
  auto f = factsOf("def f(BadArg=[]):\n    BadVar = 1\n    ok_var = 2\n");
  const auto diags = checks::FactsToDiagnostics(f, "t.py");
  ASSERT_EQ(diags.size(), 3u);
  EXPECT_EQ(diags[0].format(), "t.py: Line 2: S011 Variable 'BadVar' should be snake_case");
  EXPECT_EQ(diags[1].format(), "t.py: Line 1: S010 Argument name 'BadArg' should be snake_case");
  EXPECT_EQ(diags[2].format(), "t.py: Line 1: S012 Default argument value is mutable");
}
