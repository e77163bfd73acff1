#ifndef CINEMA_BOOKING_ERROR_HPP_
#define CINEMA_BOOKING_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace cinema {

/**
 * Error taxonomy reported by every engine operation. Kinds stay distinct so a
 * request boundary can map not-found, conflict and invalid-input separately.
 */
enum class ErrorKind {
  REFERENCE_NOT_FOUND,     // a foreign id does not resolve
  INVALID_TEMPORAL_VALUE,  // e.g. show time not in the future
  INVALID_QUANTITY,        // price, amount, capacity or duration out of range
  INVALID_INPUT,           // malformed text field or config value
  SEAT_TAKEN,              // slot already held by an active booking
  ALREADY_PAID,            // booking already has a successful payment
  NOT_FOUND,               // the operation's own target does not exist
  CONFLICT,                // blocked by dependent records or current state
  STORAGE_UNAVAILABLE      // backend unreachable or failed unexpectedly
};

/**
 * Stable upper-case name for an error kind, e.g. "SEAT_TAKEN".
 */
const char* errorKindName(ErrorKind kind);

class BookingError : public std::runtime_error {
 public:
  BookingError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace cinema

#endif  // CINEMA_BOOKING_ERROR_HPP_
