/***
 * Name: gilbridge::exceptions::ScopeViolation
 * Purpose: Exception for use of a token or borrowed reference outside its lock scope.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from GilbridgeException. Indicates a programming error
 *   (a borrowed view escaped the LockGuard that vouched for it).
 */
#pragma once

#include "gilbridge/exceptions/gilbridge_exception.h"

#include <string>
#include <utility>

namespace gilbridge {
namespace exceptions {

class ScopeViolation : public GilbridgeException {
 public:
  explicit ScopeViolation(std::string msg) noexcept : GilbridgeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace gilbridge
