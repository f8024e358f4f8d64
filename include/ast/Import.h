#pragma once

#include <vector>
#include "ast/Alias.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct Import final : Stmt {
        std::vector<Alias> names;
        Import() : Stmt(NodeKind::Import) {}
    };
}
