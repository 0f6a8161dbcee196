/***
 * Name: gilbridge::rt::RuntimeStats
 * Purpose: Expose heap and reference counting counters to tests and tooling.
 * Theory of Operation: Counters only grow; tests compare snapshots taken before
 *   and after a scenario. Immortal objects are counted in numIncref/numDecref
 *   but never in numFreed.
 */
#pragma once

#include <cstdint>

namespace gilbridge::rt {
    struct RuntimeStats {
        uint64_t numAllocated{0};
        uint64_t numFreed{0};
        uint64_t numIncref{0};
        uint64_t numDecref{0};
        uint64_t failedAllocations{0};
        uint64_t bytesAllocated{0};
        uint64_t bytesLive{0};
        uint64_t peakBytesLive{0};
    };
} // namespace gilbridge::rt
