#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct DelStmt final : Stmt {
        std::vector<std::unique_ptr<Expr>> targets;
        DelStmt() : Stmt(NodeKind::DelStmt) {}
    };
} // namespace pysca::ast
