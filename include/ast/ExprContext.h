#pragma once

namespace pysca::ast {

// Whether an expression is read, bound, or deleted at its position.
enum class ExprContext {
    Load,
    Store,
    Del
};

} // namespace pysca::ast
