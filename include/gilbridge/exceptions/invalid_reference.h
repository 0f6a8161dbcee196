/***
 * Name: gilbridge::exceptions::InvalidReference
 * Purpose: Exception for building or using a reference without a foreign object behind it.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from GilbridgeException. Raised for null
 *   raw pointers handed to reference constructors and for moved-from references.
 */
#pragma once

#include "gilbridge/exceptions/gilbridge_exception.h"

#include <string>
#include <utility>

namespace gilbridge {
namespace exceptions {

class InvalidReference : public GilbridgeException {
 public:
  explicit InvalidReference(std::string msg) noexcept : GilbridgeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace gilbridge
