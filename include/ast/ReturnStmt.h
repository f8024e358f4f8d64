#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct ReturnStmt final : Stmt {
        std::unique_ptr<Expr> value; // optional
        ReturnStmt() : Stmt(NodeKind::ReturnStmt) {}
    };
} // namespace pysca::ast
