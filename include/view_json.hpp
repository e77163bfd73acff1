#ifndef CINEMA_VIEW_JSON_HPP_
#define CINEMA_VIEW_JSON_HPP_

#include "cinema_types.hpp"

#include <nlohmann/json.hpp>

namespace cinema {

// JSON rendering for records and projections, found by nlohmann::json via
// argument-dependent lookup. Money is rendered in minor units, timestamps
// as epoch seconds. Account::credential_hash has no rendering.

void to_json(nlohmann::json& j, const Film& film);
void to_json(nlohmann::json& j, const Auditorium& auditorium);
void to_json(nlohmann::json& j, const Schedule& schedule);
void to_json(nlohmann::json& j, const Booking& booking);
void to_json(nlohmann::json& j, const Payment& payment);

void to_json(nlohmann::json& j, const AccountView& account);
void to_json(nlohmann::json& j, const ScheduleView& view);
void to_json(nlohmann::json& j, const BookingView& view);
void to_json(nlohmann::json& j, const PaymentView& view);

}  // namespace cinema

#endif  // CINEMA_VIEW_JSON_HPP_
