#pragma once

#include <string>
#include <vector>
#include "ast/Stmt.h"

namespace pysca::ast {
    struct GlobalStmt final : Stmt {
        std::vector<std::string> names;
        GlobalStmt() : Stmt(NodeKind::GlobalStmt) {}
    };
} // namespace pysca::ast
