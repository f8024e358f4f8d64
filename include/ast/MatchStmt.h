#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Pattern.h"
#include "ast/Stmt.h"

namespace pysca::ast {

struct MatchCase {
  std::unique_ptr<Pattern> pattern;
  std::unique_ptr<Expr> guard; // optional; null when absent
  std::vector<std::unique_ptr<Stmt>> body;
};

struct MatchStmt final : Stmt {
  std::unique_ptr<Expr> subject;
  std::vector<MatchCase> cases;
  MatchStmt() : Stmt(NodeKind::MatchStmt) {}
};

} // namespace pysca::ast
