#ifndef CINEMA_VALIDATION_HPP_
#define CINEMA_VALIDATION_HPP_

#include "cinema_types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace cinema {
namespace limits {

constexpr std::size_t kFilmTitle = 200;
constexpr std::size_t kFilmGenre = 50;
constexpr std::size_t kFilmDescription = 1000;
constexpr int kMinDurationMinutes = 1;
constexpr int kMaxDurationMinutes = 600;

constexpr std::size_t kAuditoriumName = 100;
constexpr std::size_t kAuditoriumFacilities = 500;
constexpr int kMinCapacity = 1;
constexpr int kMaxCapacity = 1000;

constexpr std::size_t kDisplayName = 100;
constexpr std::size_t kEmail = 100;
constexpr std::size_t kLoginName = 50;
constexpr std::size_t kPhone = 20;

constexpr std::size_t kSeatCode = 10;
constexpr std::size_t kPaymentReference = 100;

// Minor units: 0.01 .. 1,000,000.00 and 0.01 .. 10,000,000.00.
constexpr Money kMinUnitPrice = 1;
constexpr Money kMaxUnitPrice = 100000000;
constexpr Money kMinPaymentAmount = 1;
constexpr Money kMaxPaymentAmount = 1000000000;

}  // namespace limits

// Each check throws BookingError on violation: text checks with
// INVALID_INPUT, numeric ranges with INVALID_QUANTITY.

void requireText(const char* field, const std::string& value, std::size_t max_length);
void requireOptionalText(const char* field, const std::optional<std::string>& value,
                         std::size_t max_length);
void requireRange(const char* field, std::int64_t value, std::int64_t min, std::int64_t max);
void requireEmail(const std::string& value);

}  // namespace cinema

#endif  // CINEMA_VALIDATION_HPP_
