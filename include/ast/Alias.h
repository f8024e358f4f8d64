#pragma once

#include <string>

namespace pysca::ast {
    // One 'name [as asname]' entry of an import statement.
    struct Alias {
        std::string name;   // dotted name, or "*"
        std::string asname; // empty if none
    };
}
