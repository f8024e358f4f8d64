#pragma once

#include <string>
#include <vector>
#include "ast/Stmt.h"

namespace pysca::ast {
    struct NonlocalStmt final : Stmt {
        std::vector<std::string> names;
        NonlocalStmt() : Stmt(NodeKind::NonlocalStmt) {}
    };
} // namespace pysca::ast
