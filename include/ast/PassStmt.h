#pragma once

#include "ast/Stmt.h"

namespace pysca::ast {
    struct PassStmt final : Stmt {
        PassStmt() : Stmt(NodeKind::PassStmt) {}
    };
}
