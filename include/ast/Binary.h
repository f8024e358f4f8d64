/**
 * @file
 * @brief AST declarations.
 */
#pragma once
#include <memory>

#include "ast/BinaryOperator.h"
#include "ast/Expr.h"

namespace pysca::ast {
    // Arithmetic, bitwise and boolean (And/Or) binary operations.
    struct Binary final : Expr {
        BinaryOperator op;
        std::unique_ptr<Expr> lhs;
        std::unique_ptr<Expr> rhs;

        Binary(const BinaryOperator o, std::unique_ptr<Expr> a, std::unique_ptr<Expr> b)
            : Expr(NodeKind::BinaryExpr), op(o), lhs(std::move(a)), rhs(std::move(b)) {
        }
    };
} // namespace pysca::ast
