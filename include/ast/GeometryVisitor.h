/**
 * @file
 * @brief AST geometry visitor declarations.
 */
#pragma once

#include <cstdint>
#include "ast/Module.h"
#include "ast/RecursiveVisitor.h"

namespace pysca::ast {

// Node count and maximum nesting depth of a tree; reported in run metrics.
struct GeometrySummary {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

struct GeometryVisitor final : public RecursiveVisitor {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
  uint64_t depth{0};

  void enter(const Node&) override;
  void leave(const Node&) override;
};

GeometrySummary ComputeGeometry(const Module& module);

} // namespace pysca::ast
