/***
 * Name: pysca::exceptions::PyscaException::PyscaException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pysca/exceptions/pysca_exception.h"

#include <utility>

namespace pysca {
namespace exceptions {

PyscaException::PyscaException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pysca
