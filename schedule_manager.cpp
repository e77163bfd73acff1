#include "schedule_manager.hpp"

#include "booking_error.hpp"
#include "observability/logger.hpp"
#include "validation.hpp"

namespace cinema {

using observability::LogLevel;

ScheduleManager::ScheduleManager(ConsistencyCoordinator& coordinator, const Clock& clock)
    : coordinator_(coordinator), clock_(clock) {}

void ScheduleManager::validate(const ScheduleRequest& request) {
  coordinator_.requireReference(EntityKind::AUDITORIUM, request.auditorium_id);
  coordinator_.requireReference(EntityKind::FILM, request.film_id);

  Timestamp now = clock_.now();
  if (request.show_time <= now) {
    throw BookingError(ErrorKind::INVALID_TEMPORAL_VALUE,
                       "show time " + std::to_string(request.show_time) +
                           " is not after " + std::to_string(now));
  }
  requireRange("unit_price", request.unit_price, limits::kMinUnitPrice, limits::kMaxUnitPrice);
}

ScheduleView ScheduleManager::Create(const ScheduleRequest& request) {
  validate(request);

  Schedule schedule;
  schedule.auditorium_id = request.auditorium_id;
  schedule.film_id = request.film_id;
  schedule.show_time = request.show_time;
  schedule.unit_price = request.unit_price;

  auto result = coordinator_.store().insertSchedule(schedule);
  if (!result.ok()) {
    // Catalog row removed between validation and insert.
    throw BookingError(ErrorKind::REFERENCE_NOT_FOUND,
                       "auditorium or film disappeared while scheduling");
  }

  LOG_BUILDER(LogLevel::INFO, "Schedule created")
      .field("schedule_id", result.record->id)
      .field("show_time", result.record->show_time);
  return coordinator_.scheduleView(*result.record);
}

ScheduleView ScheduleManager::Update(Id id, const ScheduleRequest& request) {
  coordinator_.requireTarget(EntityKind::SCHEDULE, id);
  validate(request);

  Schedule schedule;
  schedule.id = id;
  schedule.auditorium_id = request.auditorium_id;
  schedule.film_id = request.film_id;
  schedule.show_time = request.show_time;
  schedule.unit_price = request.unit_price;

  auto result = coordinator_.store().updateSchedule(schedule);
  if (result.status == WriteStatus::NOT_FOUND) {
    throw BookingError(ErrorKind::NOT_FOUND, "schedule " + std::to_string(id) + " not found");
  }
  if (!result.ok()) {
    throw BookingError(ErrorKind::REFERENCE_NOT_FOUND,
                       "auditorium or film disappeared while rescheduling");
  }

  LOG_BUILDER(LogLevel::INFO, "Schedule updated").field("schedule_id", id);
  return coordinator_.scheduleView(*result.record);
}

ScheduleView ScheduleManager::Get(Id id) {
  auto schedule = coordinator_.store().findSchedule(id);
  if (!schedule) {
    throw BookingError(ErrorKind::NOT_FOUND, "schedule " + std::to_string(id) + " not found");
  }
  return coordinator_.scheduleView(*schedule);
}

std::vector<ScheduleView> ScheduleManager::List() {
  std::vector<ScheduleView> views;
  for (const auto& schedule : coordinator_.store().listSchedules()) {
    views.push_back(coordinator_.scheduleView(schedule));
  }
  return views;
}

void ScheduleManager::Delete(Id id) {
  switch (coordinator_.store().deleteScheduleIfUnreferenced(id)) {
    case WriteStatus::APPLIED:
      LOG_BUILDER(LogLevel::INFO, "Schedule deleted").field("schedule_id", id);
      return;
    case WriteStatus::HAS_DEPENDENTS:
      throw BookingError(ErrorKind::CONFLICT,
                         "schedule " + std::to_string(id) + " has active bookings or payments");
    default:
      throw BookingError(ErrorKind::NOT_FOUND, "schedule " + std::to_string(id) + " not found");
  }
}

}  // namespace cinema
