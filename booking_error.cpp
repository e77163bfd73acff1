#include "booking_error.hpp"

namespace cinema {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::REFERENCE_NOT_FOUND: return "REFERENCE_NOT_FOUND";
    case ErrorKind::INVALID_TEMPORAL_VALUE: return "INVALID_TEMPORAL_VALUE";
    case ErrorKind::INVALID_QUANTITY: return "INVALID_QUANTITY";
    case ErrorKind::INVALID_INPUT: return "INVALID_INPUT";
    case ErrorKind::SEAT_TAKEN: return "SEAT_TAKEN";
    case ErrorKind::ALREADY_PAID: return "ALREADY_PAID";
    case ErrorKind::NOT_FOUND: return "NOT_FOUND";
    case ErrorKind::CONFLICT: return "CONFLICT";
    case ErrorKind::STORAGE_UNAVAILABLE: return "STORAGE_UNAVAILABLE";
  }
  return "UNKNOWN";
}

}  // namespace cinema
