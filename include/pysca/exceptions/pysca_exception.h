/***
 * Name: pysca::exceptions::PyscaException
 * Purpose: Base class for all pysca exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in pysca must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pysca {
namespace exceptions {

class PyscaException : public std::exception {
 public:
  virtual ~PyscaException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PyscaException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pysca
