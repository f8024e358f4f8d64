/**
 * @file
 * @brief AST try statement declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/ExceptHandler.h"
#include "ast/HasBody.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct TryStmt final : Stmt, HasBody<Stmt> {
        std::vector<std::unique_ptr<ExceptHandler>> handlers;
        std::vector<std::unique_ptr<Stmt>> orelse;
        std::vector<std::unique_ptr<Stmt>> finalbody;
        bool isStar{false}; // except* groups
        TryStmt() : Stmt(NodeKind::TryStmt) {}
    };
} // namespace pysca::ast
