/**
 * @file
 * @brief AST base node declarations.
 */
#pragma once

#include "ast/NodeKind.h"

namespace pysca::ast {

    struct VisitorBase; // fwd

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;

        // Polymorphic dispatch entrypoint (central switch in ast/Visitor.h)
        virtual void accept(VisitorBase& v) const;

        int line{0};
        int col{0};
    };

} // namespace pysca::ast
