#pragma once

#include "gold/time/i_time_provider.hpp"

namespace gold {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time
// -----------------------------------------------------------------------------
// Production clock used by CustodyEngine when no other provider is injected.
// Stateless, so safe to share between threads.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace gold
