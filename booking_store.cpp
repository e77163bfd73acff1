#include "booking_store.hpp"

namespace cinema {

const char* entityKindName(EntityKind kind) {
  switch (kind) {
    case EntityKind::FILM: return "film";
    case EntityKind::AUDITORIUM: return "auditorium";
    case EntityKind::ACCOUNT: return "account";
    case EntityKind::SCHEDULE: return "schedule";
    case EntityKind::BOOKING: return "booking";
    case EntityKind::PAYMENT: return "payment";
  }
  return "entity";
}

}  // namespace cinema
