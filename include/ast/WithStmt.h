#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct WithItem {
        std::unique_ptr<Expr> context;
        std::unique_ptr<Expr> optionalVars; // 'as' target, store context; may be null
    };

    struct WithStmt final : Stmt, HasBody<Stmt> {
        std::vector<WithItem> items;
        bool isAsync{false};
        WithStmt() : Stmt(NodeKind::WithStmt) {}
    };
} // namespace pysca::ast
