/**
 * @file
 * @brief Aggregate include for all AST node declarations.
 */
#pragma once

#include "ast/Alias.h"
#include "ast/AnnAssignStmt.h"
#include "ast/AssertStmt.h"
#include "ast/AssignStmt.h"
#include "ast/Attribute.h"
#include "ast/AugAssignStmt.h"
#include "ast/AwaitExpr.h"
#include "ast/Binary.h"
#include "ast/BinaryOperator.h"
#include "ast/BreakStmt.h"
#include "ast/Call.h"
#include "ast/ClassDef.h"
#include "ast/Compare.h"
#include "ast/Comprehension.h"
#include "ast/ContinueStmt.h"
#include "ast/DelStmt.h"
#include "ast/DictLiteral.h"
#include "ast/ExceptHandler.h"
#include "ast/Expr.h"
#include "ast/ExprContext.h"
#include "ast/ExprStmt.h"
#include "ast/ForStmt.h"
#include "ast/FunctionDef.h"
#include "ast/GlobalStmt.h"
#include "ast/HasBody.h"
#include "ast/HasBodyPair.h"
#include "ast/HasName.h"
#include "ast/IfExpr.h"
#include "ast/IfStmt.h"
#include "ast/Import.h"
#include "ast/ImportFrom.h"
#include "ast/LambdaExpr.h"
#include "ast/ListLiteral.h"
#include "ast/Literal.h"
#include "ast/MatchStmt.h"
#include "ast/Module.h"
#include "ast/Name.h"
#include "ast/NamedExpr.h"
#include "ast/Node.h"
#include "ast/NodeKind.h"
#include "ast/NonlocalStmt.h"
#include "ast/Param.h"
#include "ast/PassStmt.h"
#include "ast/Pattern.h"
#include "ast/RaiseStmt.h"
#include "ast/ReturnStmt.h"
#include "ast/SetLiteral.h"
#include "ast/Slice.h"
#include "ast/Starred.h"
#include "ast/Stmt.h"
#include "ast/Subscript.h"
#include "ast/TryStmt.h"
#include "ast/TupleLiteral.h"
#include "ast/TypeAliasStmt.h"
#include "ast/Unary.h"
#include "ast/UnaryOperator.h"
#include "ast/WhileStmt.h"
#include "ast/WithStmt.h"
#include "ast/YieldExpr.h"
