#pragma once

#include "gold/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace gold {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// ITimeProvider speaks epoch milliseconds; event structs carry a Timestamp.
// These two helpers convert between them and are exact inverses at
// millisecond resolution.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace gold
