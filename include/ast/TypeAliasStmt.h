#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/HasName.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    // type Name[T, ...] = value   (the alias name is a declaration, not a stored variable)
    struct TypeAliasStmt final : Stmt, HasName {
        std::vector<std::string> typeParams{};
        std::unique_ptr<Expr> value;
        explicit TypeAliasStmt(std::string n) : Stmt(NodeKind::TypeAliasStmt), HasName{std::move(n)} {}
    };
}
