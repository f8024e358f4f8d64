#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ast/Expr.h"

namespace pysca::ast {
    struct KeywordArg { std::string name; std::unique_ptr<Expr> value; }; // empty name: **expr

    struct Call final : Expr {
        std::unique_ptr<Expr> callee;
        std::vector<std::unique_ptr<Expr>> args; // positional, *expr as Starred
        std::vector<KeywordArg> keywords;
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace pysca::ast
