/**
 * @file
 * @brief AST name expression declarations.
 */
#pragma once

#include <string>
#include "ast/Expr.h"
#include "ast/ExprContext.h"

namespace pysca::ast {
    struct Name final : Expr {
        std::string id;
        ExprContext ctx{ExprContext::Load};
        explicit Name(std::string i) : Expr(NodeKind::Name), id(std::move(i)) {}
    };
} // namespace pysca::ast
