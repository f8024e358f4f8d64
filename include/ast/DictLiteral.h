#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pysca::ast {
    struct DictLiteral final : Expr {
        std::vector<std::unique_ptr<Expr>> keys;   // null key marks a '**mapping' entry
        std::vector<std::unique_ptr<Expr>> values; // parallel to keys
        DictLiteral() : Expr(NodeKind::DictLiteral) {}
    };
} // namespace pysca::ast
