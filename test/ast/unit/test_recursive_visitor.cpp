/***
 * Name: test_recursive_visitor
 * Purpose: Walk order and pruning of the recursive visitor.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "ast/RecursiveVisitor.h"
#include "parser/unit/ParseHelpers.h"

using namespace pysca;

namespace {

struct NameRecorder : ast::RecursiveVisitor {
  using RecursiveVisitor::visit;
  std::vector<std::string> names;
  void visit(const ast::Name& n) override { names.push_back(n.id); }
};

// Skips function bodies entirely.
struct BodySkipper : NameRecorder {
  using NameRecorder::visit;
  void visit(const ast::FunctionDef& fn) override { walkAll(fn.decorators); }
};

} // namespace

TEST(RecursiveVisitor, FunctionFieldsInOrder) {
  auto mod = testutil::parseSrc(
      "@deco\n"
      "def f(a: ann = dflt) -> ret:\n"
      "    return body\n");
  NameRecorder rec;
  rec.walk(mod.get());
  const std::vector<std::string> expected{"ann", "dflt", "body", "deco", "ret"};
  EXPECT_EQ(rec.names, expected);
}

TEST(RecursiveVisitor, TargetsBeforeValues) {
  auto mod = testutil::parseSrc("lhs = rhs\nfor t in it:\n    use\n");
  NameRecorder rec;
  rec.walk(mod.get());
  const std::vector<std::string> expected{"lhs", "rhs", "t", "it", "use"};
  EXPECT_EQ(rec.names, expected);
}

TEST(RecursiveVisitor, ComprehensionClauses) {
  auto mod = testutil::parseSrc("r = [elt for tgt in src if cond]\n");
  NameRecorder rec;
  rec.walk(mod.get());
  const std::vector<std::string> expected{"r", "elt", "tgt", "src", "cond"};
  EXPECT_EQ(rec.names, expected);
}

TEST(RecursiveVisitor, OverrideCanPruneSubtree) {
  auto mod = testutil::parseSrc("@deco\ndef f():\n    inner = 1\nouter = 2\n");
  BodySkipper rec;
  rec.walk(mod.get());
  const std::vector<std::string> expected{"deco", "outer"};
  EXPECT_EQ(rec.names, expected);
}
