#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct RaiseStmt final : Stmt {
        std::unique_ptr<Expr> exc;   // optional
        std::unique_ptr<Expr> cause; // optional: raise X from Y
        RaiseStmt() : Stmt(NodeKind::RaiseStmt) {}
    };
} // namespace pysca::ast
