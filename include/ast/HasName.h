/**
 * @file
 * @brief AST utility declarations (HasName mixin).
 */
#pragma once

#include <string>

namespace pysca::ast {

struct HasName {
    std::string name;
};

}
