/***
 * Name: gilbridge::exceptions::ConfigError
 * Purpose: Exception for invalid gilbridge configuration values.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from GilbridgeException.
 */
#pragma once

#include "gilbridge/exceptions/gilbridge_exception.h"

#include <string>
#include <utility>

namespace gilbridge {
namespace exceptions {

class ConfigError : public GilbridgeException {
 public:
  explicit ConfigError(std::string msg) noexcept : GilbridgeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace gilbridge
