/**
 * @file
 * @brief AST unary operator enumeration.
 */
#pragma once

namespace pysca::ast {

enum class UnaryOperator {
    Neg,
    Pos,
    Not,
    BitNot
};

} // namespace pysca::ast
