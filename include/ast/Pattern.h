/**
 * @file
 * @brief AST match-pattern declarations.
 */
/***
 * Name: pysca::ast::Pattern
 * Purpose: One node type for every structural pattern form of a match/case.
 * Theory of Operation:
 *   `form` selects which fields are meaningful:
 *     Wildcard  `_`                  (none)
 *     Capture   `x`                  name
 *     Value     `1`, `a.b`, `-1`     value
 *     Sequence  `[p, *rest]`         children
 *     Star      `*rest`              name (empty for `*_`)
 *     Mapping   `{k: p, **rest}`     keys + children (parallel), name for **rest
 *     Class     `C(p, k=p)`          value (class expr), children, keywordNames + keywordPatterns
 *     Or        `p | q`              children
 *     As        `p as x`             children[0], name
 *   Capture names bind like assignments at runtime but are not expression
 *   Names; the tree keeps them as plain strings.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"
#include "ast/Node.h"

namespace pysca::ast {

enum class PatternForm { Wildcard, Capture, Value, Sequence, Star, Mapping, Class, Or, As };

struct Pattern final : Node {
    PatternForm form{PatternForm::Wildcard};
    std::string name;
    std::unique_ptr<Expr> value;
    std::vector<std::unique_ptr<Expr>> keys;
    std::vector<std::unique_ptr<Pattern>> children;
    std::vector<std::string> keywordNames;
    std::vector<std::unique_ptr<Pattern>> keywordPatterns;
    explicit Pattern(const PatternForm f) : Node(NodeKind::Pattern), form(f) {}
};

} // namespace pysca::ast
