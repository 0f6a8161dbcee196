/***
 * Name: gilbridge::exceptions::GilbridgeException
 * Purpose: Base class for all gilbridge exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites.
 *   Exceptions are reserved for programming errors, configuration errors and the
 *   fatal allocation path; recoverable foreign failures travel as Result<T>.
 */
#pragma once

#include <exception>
#include <string>

namespace gilbridge {
namespace exceptions {

class GilbridgeException : public std::exception {
 public:
  virtual ~GilbridgeException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit GilbridgeException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace gilbridge
