#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/HasBodyPair.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct IfStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> cond;
        // elif chains nest as a single IfStmt in elseBody
        IfStmt() : Stmt(NodeKind::IfStmt) {}
    };
} // namespace pysca::ast
