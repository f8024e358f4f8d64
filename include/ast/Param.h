#pragma once

#include <memory>
#include <string>
#include "ast/Expr.h"

namespace pysca::ast {
    struct Param {
        std::string name;
        std::unique_ptr<Expr> annotation{};   // optional
        std::unique_ptr<Expr> defaultValue{}; // optional
        bool isVarArg{false};   // *args
        bool isKwVarArg{false}; // **kwargs
        bool isKwOnly{false};   // kw-only param (after * or *args)
        bool isPosOnly{false};  // positional-only (before '/')
        int line{0};
        int col{0};
    };
} // namespace pysca::ast
