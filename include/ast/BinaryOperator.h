#pragma once

namespace pysca::ast {

enum class BinaryOperator {
    Add,
    Sub,
    Mul,
    MatMul,
    Div,
    Mod,
    FloorDiv,
    Pow,
    LShift,
    RShift,
    BitAnd,
    BitOr,
    BitXor,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    Is,
    IsNot,
    In,
    NotIn,
    And,
    Or
};

} // namespace pysca::ast
