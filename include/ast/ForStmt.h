#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/HasBodyPair.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct ForStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> target;
        std::unique_ptr<Expr> iterable;
        bool isAsync{false};
        ForStmt() : Stmt(NodeKind::ForStmt) {}
    };
} // namespace pysca::ast
