/***
 * Name: gilbridge::rt::TypeTag
 * Purpose: Payload layout tags used by the runtime to identify heap object kinds.
 * Theory of Operation: The tag selects the payload struct behind an object
 *   header. Several types may share a layout (bool reuses Int; every exception
 *   type uses Exception).
 */
#pragma once

#include <cstdint>

namespace gilbridge::rt {
    enum class TypeTag : uint32_t {
        String = 1,
        Int = 2,
        Float = 3,
        Bool = 4,
        Object = 6,
        Bytes = 8,
        None = 10,
        Exception = 11
    };
} // namespace gilbridge::rt
