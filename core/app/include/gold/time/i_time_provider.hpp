#pragma once

#include <cstdint>

namespace gold {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract clock for event timestamps
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every component that stamps a record or an
//         audit event (account creation, mint, signature, execution).
//
// @details
// Components never call std::chrono::system_clock directly. The engine
// injects LiveTimeProvider in production; tests inject
// SimulationTimeProvider so that event timestamps are deterministic and can
// be asserted exactly.
//
// Time is exchanged as int64_t milliseconds since the Unix epoch, which is
// also the representation used in JSON telemetry.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads.
//
// Ownership:
//   Components hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace gold
