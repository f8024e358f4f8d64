#pragma once

#include "ast/Stmt.h"

namespace pysca::ast {
    struct ContinueStmt final : Stmt {
        ContinueStmt() : Stmt(NodeKind::ContinueStmt) {}
    };
}
