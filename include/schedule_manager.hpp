#ifndef CINEMA_SCHEDULE_MANAGER_HPP_
#define CINEMA_SCHEDULE_MANAGER_HPP_

#include "cinema_types.hpp"
#include "clock.hpp"
#include "consistency_coordinator.hpp"

#include <vector>

namespace cinema {

struct ScheduleRequest {
  Id auditorium_id = 0;
  Id film_id = 0;
  Timestamp show_time = 0;
  Money unit_price = 0;
};

/**
 * Screenings: an auditorium showing a film at a time for a unit price.
 */
class ScheduleManager {
 public:
  ScheduleManager(ConsistencyCoordinator& coordinator, const Clock& clock);

  // Non-copyable
  ScheduleManager(const ScheduleManager&) = delete;
  ScheduleManager& operator=(const ScheduleManager&) = delete;

  /**
   * Creates a screening. Fails with REFERENCE_NOT_FOUND for an unknown
   * auditorium or film, INVALID_TEMPORAL_VALUE when show_time is not after
   * now, INVALID_QUANTITY for a price outside (0, 1,000,000.00].
   */
  ScheduleView Create(const ScheduleRequest& request);

  /**
   * Replaces all four fields of schedule `id`. Same rules as Create, plus
   * NOT_FOUND for an unknown id.
   */
  ScheduleView Update(Id id, const ScheduleRequest& request);

  ScheduleView Get(Id id);
  std::vector<ScheduleView> List();

  /**
   * Removes a screening nobody holds or has paid for. CONFLICT while a
   * non-cancelled booking, or a successful payment, references it.
   */
  void Delete(Id id);

 private:
  void validate(const ScheduleRequest& request);

  ConsistencyCoordinator& coordinator_;
  const Clock& clock_;
};

}  // namespace cinema

#endif  // CINEMA_SCHEDULE_MANAGER_HPP_
