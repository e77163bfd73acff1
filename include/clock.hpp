#ifndef CINEMA_CLOCK_HPP_
#define CINEMA_CLOCK_HPP_

#include "cinema_types.hpp"

namespace cinema {

/**
 * Source of server-authoritative time. Booking and payment timestamps and the
 * future-show-time rule all read from here, never from the caller.
 */
class Clock {
 public:
  virtual ~Clock() = default;

  virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
 public:
  Timestamp now() const override;
};

}  // namespace cinema

#endif  // CINEMA_CLOCK_HPP_
