/***
 * Name: gilbridge::exceptions::GilbridgeException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "gilbridge/exceptions/gilbridge_exception.h"

namespace gilbridge::exceptions {

const char* GilbridgeException::what() const noexcept { return message_.c_str(); }

}  // namespace gilbridge::exceptions
