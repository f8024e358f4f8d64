#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"
#include "ast/Param.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct FunctionDef final : Stmt, HasBody<Stmt>, HasName {
        std::vector<Param> params;
        std::vector<std::unique_ptr<Expr>> decorators; // optional decorator expressions
        std::unique_ptr<Expr> returns{};              // optional '-> annotation'
        std::vector<std::string> typeParams{};         // PEP 695 names, shape only
        bool isAsync{false};
        explicit FunctionDef(std::string n)
            : Stmt(NodeKind::FunctionDef), HasName{std::move(n)} {}
    };

} // namespace pysca::ast
