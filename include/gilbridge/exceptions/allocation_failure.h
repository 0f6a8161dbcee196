/***
 * Name: gilbridge::exceptions::AllocationFailure
 * Purpose: Fatal condition raised when the foreign runtime cannot allocate an object.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from GilbridgeException. Thrown only by fatal::allocationFailure
 *   under AllocationFailurePolicy::Throw; never converted into a Result.
 */
#pragma once

#include "gilbridge/exceptions/gilbridge_exception.h"

#include <string>
#include <utility>

namespace gilbridge {
namespace exceptions {

class AllocationFailure : public GilbridgeException {
 public:
  explicit AllocationFailure(std::string msg) noexcept : GilbridgeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace gilbridge
