/***
 * Name: pysca::exceptions::ParseError
 * Purpose: Exception for malformed Python source (tokenizer or parser failure).
 * Inputs: Error message, already carrying file:line:col and source context
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyscaException. A file that
 *   raises ParseError produces no diagnostics.
 */
#pragma once

#include <string>
#include <utility>

#include "pysca/exceptions/pysca_exception.h"

namespace pysca {
namespace exceptions {

class ParseError : public PyscaException {
 public:
  explicit ParseError(std::string msg) noexcept : PyscaException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pysca
