/***
 * Name: pysca::exceptions::PyscaException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pysca/exceptions/pysca_exception.h"

namespace pysca::exceptions {

const char* PyscaException::what() const noexcept { return message_.c_str(); }

}  // namespace pysca::exceptions
