#pragma once

#include <string>

namespace pysca::cli {

    std::string Usage();

} // namespace pysca::cli
