#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/HasBodyPair.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct WhileStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> cond;
        WhileStmt() : Stmt(NodeKind::WhileStmt) {}
    };
} // namespace pysca::ast
