/**
 * @file
 * @brief AST literal declarations.
 */
#pragma once

#include <string>
#include "ast/Expr.h"

namespace pysca::ast {

// Numbers keep their source spelling; no value is ever computed from them.
template <typename T, NodeKind K>
struct Literal final : Expr {
    T value;
    explicit Literal(T v) : Expr(K), value(std::move(v)) {}
};

using IntLiteral = Literal<std::string, NodeKind::IntLiteral>;
using FloatLiteral = Literal<std::string, NodeKind::FloatLiteral>;
using ImagLiteral = Literal<std::string, NodeKind::ImagLiteral>;
using StringLiteral = Literal<std::string, NodeKind::StringLiteral>; // adjacent pieces concatenated, quotes kept
using BytesLiteral = Literal<std::string, NodeKind::BytesLiteral>;
using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;

struct NoneLiteral final : Expr {
    NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
};

struct EllipsisLiteral final : Expr {
    EllipsisLiteral() : Expr(NodeKind::EllipsisLiteral) {}
};

// f-strings are kept as text; replacement fields are not parsed.
struct FStringLiteral final : Expr {
    std::string text;
    explicit FStringLiteral(std::string t) : Expr(NodeKind::FStringLiteral), text(std::move(t)) {}
};

} // namespace pysca::ast
