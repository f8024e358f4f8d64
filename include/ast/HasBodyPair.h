/**
 * @file
 * @brief AST utility declarations (HasBodyPair mixin).
 */
/***
 * Name: pysca::ast::HasBodyPair
 * Purpose: Mixin for nodes that contain then/else statement lists
 *   (if/elif chains, while-else, for-else).
 */
#pragma once

#include <memory>
#include <vector>

namespace pysca::ast {

template <typename StmtT>
struct HasBodyPair {
    std::vector<std::unique_ptr<StmtT>> thenBody;
    std::vector<std::unique_ptr<StmtT>> elseBody;
};

} // namespace pysca::ast
