#pragma once

#include <string>
#include <vector>
#include "ast/Alias.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct ImportFrom final : Stmt {
        std::string module; // may be empty for 'from . import x'
        int level{0};       // number of leading dots
        std::vector<Alias> names;
        ImportFrom() : Stmt(NodeKind::ImportFrom) {}
    };
}
