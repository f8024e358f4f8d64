/***
 * Name: pysca::exceptions::FileReadError
 * Purpose: Exception for input errors: missing path, not a regular file, unreadable.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyscaException. Raised before
 *   any analysis so callers can tell it apart from a clean, empty result.
 */
#pragma once

#include <string>
#include <utility>

#include "pysca/exceptions/pysca_exception.h"

namespace pysca {
namespace exceptions {

class FileReadError : public PyscaException {
 public:
  explicit FileReadError(std::string msg) noexcept : PyscaException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pysca
