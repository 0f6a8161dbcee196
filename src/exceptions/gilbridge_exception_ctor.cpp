/***
 * Name: gilbridge::exceptions::GilbridgeException::GilbridgeException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "gilbridge/exceptions/gilbridge_exception.h"

#include <string>
#include <utility>

namespace gilbridge {
namespace exceptions {

GilbridgeException::GilbridgeException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace gilbridge
