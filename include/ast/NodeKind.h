/**
 * @file
 * @brief AST node kind enumeration.
 */
#pragma once

namespace pysca::ast {

enum class NodeKind {
    Module,
    FunctionDef,
    ClassDef,
    ReturnStmt,
    AssignStmt,
    AnnAssignStmt,
    AugAssignStmt,
    ExprStmt,
    IfStmt,
    WhileStmt,
    ForStmt,
    TryStmt,
    ExceptHandler,
    WithStmt,
    Import,
    ImportFrom,
    RaiseStmt,
    DelStmt,
    AssertStmt,
    GlobalStmt,
    NonlocalStmt,
    PassStmt,
    BreakStmt,
    ContinueStmt,
    MatchStmt,
    TypeAliasStmt,
    Pattern,
    Name,
    IntLiteral,
    FloatLiteral,
    ImagLiteral,
    StringLiteral,
    BytesLiteral,
    BoolLiteral,
    NoneLiteral,
    EllipsisLiteral,
    FStringLiteral,
    Attribute,
    Subscript,
    Slice,
    Starred,
    Call,
    BinaryExpr,
    UnaryExpr,
    Compare,
    IfExpr,
    LambdaExpr,
    NamedExpr,
    TupleLiteral,
    ListLiteral,
    SetLiteral,
    DictLiteral,
    ListComp,
    SetComp,
    DictComp,
    GeneratorExpr,
    YieldExpr,
    AwaitExpr
};

} // namespace pysca::ast
