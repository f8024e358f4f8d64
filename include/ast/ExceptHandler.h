#pragma once

#include <memory>
#include <string>
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct ExceptHandler final : Node, HasBody<Stmt> {
        std::unique_ptr<Expr> type; // null for a bare 'except:'
        std::string name;           // empty if no 'as'
        ExceptHandler() : Node(NodeKind::ExceptHandler) {}
    };
} // namespace pysca::ast
