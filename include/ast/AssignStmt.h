#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct AssignStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets; // a = b = value: one entry per target
        std::unique_ptr<Expr> value;
        AssignStmt() : Stmt(NodeKind::AssignStmt) {}
    };
} // namespace pysca::ast
