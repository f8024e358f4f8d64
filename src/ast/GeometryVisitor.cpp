/**
 * @file
 * @brief AST geometry visitor implementation.
 */
/***
 * Name: pysca::ast::GeometryVisitor
 * Purpose: AST visitor computing node count and max depth.
 */
#include "ast/GeometryVisitor.h"

#include <algorithm>

namespace pysca::ast {
    void GeometryVisitor::enter(const Node&) {
        ++nodes;
        maxDepth = std::max(maxDepth, depth);
        ++depth;
    }

    void GeometryVisitor::leave(const Node&) { --depth; }

    GeometrySummary ComputeGeometry(const Module& module) {
        GeometryVisitor visitor;
        visitor.walk(&module);
        return GeometrySummary{visitor.nodes, visitor.maxDepth};
    }
} // namespace pysca::ast
