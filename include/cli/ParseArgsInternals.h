/**
 * @file
 * @brief Declarations for pysca CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cli/Options.h"

namespace pysca::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Handle boolean, flag-only options like -h, --metrics, --log-lexer. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (log-path). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

} // namespace pysca::cli::detail
