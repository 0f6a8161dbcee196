/***
 * Name: gilbridge::parseAllocationFailurePolicy
 * Purpose: Parse the allocation failure policy name.
 * Inputs:
 *   - text: "throw" or "abort", any case
 * Outputs:
 *   - out: parsed policy on success
 * Theory of Operation: Lowercases a copy and compares; returns false otherwise.
 */
#include "gilbridge/Config.h"

#include <cctype>
#include <string>

namespace gilbridge {

bool parseAllocationFailurePolicy(const std::string& text, AllocationFailurePolicy& out) {
  std::string lower = text;
  for (auto& c : lower) { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  if (lower == "throw") { out = AllocationFailurePolicy::Throw; return true; }
  if (lower == "abort") { out = AllocationFailurePolicy::Abort; return true; }
  return false;
}

}  // namespace gilbridge
