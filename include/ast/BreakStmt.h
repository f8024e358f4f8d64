#pragma once

#include "ast/Stmt.h"

namespace pysca::ast {
    struct BreakStmt final : Stmt {
        BreakStmt() : Stmt(NodeKind::BreakStmt) {}
    };
}
