#include "view_json.hpp"

#include <optional>
#include <string>

namespace cinema {

namespace {

nlohmann::json nullable(const std::optional<std::string>& value) {
  if (value) return *value;
  return nullptr;
}

}  // namespace

void to_json(nlohmann::json& j, const Film& film) {
  j = nlohmann::json{{"id", film.id},
                     {"title", film.title},
                     {"genre", nullable(film.genre)},
                     {"duration_minutes", film.duration_minutes},
                     {"description", nullable(film.description)}};
}

void to_json(nlohmann::json& j, const Auditorium& auditorium) {
  j = nlohmann::json{{"id", auditorium.id},
                     {"name", auditorium.name},
                     {"capacity", auditorium.capacity},
                     {"facilities", nullable(auditorium.facilities)}};
}

void to_json(nlohmann::json& j, const Schedule& schedule) {
  j = nlohmann::json{{"id", schedule.id},
                     {"auditorium_id", schedule.auditorium_id},
                     {"film_id", schedule.film_id},
                     {"show_time", schedule.show_time},
                     {"unit_price", schedule.unit_price}};
}

void to_json(nlohmann::json& j, const Booking& booking) {
  j = nlohmann::json{{"id", booking.id},
                     {"schedule_id", booking.schedule_id},
                     {"account_id", booking.account_id},
                     {"seat_code", booking.seat_code},
                     {"status", toString(booking.status)},
                     {"booked_at", booking.booked_at}};
}

void to_json(nlohmann::json& j, const Payment& payment) {
  j = nlohmann::json{{"id", payment.id},
                     {"booking_id", payment.booking_id},
                     {"account_id", payment.account_id},
                     {"amount", payment.amount},
                     {"method", toString(payment.method)},
                     {"status", toString(payment.status)},
                     {"recorded_at", payment.recorded_at},
                     {"reference", nullable(payment.reference)}};
}

void to_json(nlohmann::json& j, const AccountView& account) {
  j = nlohmann::json{{"id", account.id},
                     {"display_name", account.display_name},
                     {"email", account.email},
                     {"login_name", account.login_name},
                     {"phone", nullable(account.phone)},
                     {"role", toString(account.role)},
                     {"created_at", account.created_at},
                     {"active", account.active}};
}

void to_json(nlohmann::json& j, const ScheduleView& view) {
  j = view.schedule;
  j["auditorium"] = view.auditorium;
  j["film"] = view.film;
}

void to_json(nlohmann::json& j, const BookingView& view) {
  j = view.booking;
  j["schedule"] = view.schedule;
  j["account"] = view.account;
}

void to_json(nlohmann::json& j, const PaymentView& view) {
  j = view.payment;
  j["booking"] = view.booking;
  j["account"] = view.account;
}

}  // namespace cinema
