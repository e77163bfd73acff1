#include "validation.hpp"

#include "booking_error.hpp"

#include <algorithm>
#include <cctype>

namespace cinema {

namespace {

bool blank(const std::string& value) {
  return std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

void requireText(const char* field, const std::string& value, std::size_t max_length) {
  if (blank(value)) {
    throw BookingError(ErrorKind::INVALID_INPUT, std::string(field) + " is required");
  }
  if (value.size() > max_length) {
    throw BookingError(ErrorKind::INVALID_INPUT,
                       std::string(field) + " exceeds " + std::to_string(max_length) +
                           " characters");
  }
}

void requireOptionalText(const char* field, const std::optional<std::string>& value,
                         std::size_t max_length) {
  if (value && value->size() > max_length) {
    throw BookingError(ErrorKind::INVALID_INPUT,
                       std::string(field) + " exceeds " + std::to_string(max_length) +
                           " characters");
  }
}

void requireRange(const char* field, std::int64_t value, std::int64_t min, std::int64_t max) {
  if (value < min || value > max) {
    throw BookingError(ErrorKind::INVALID_QUANTITY,
                       std::string(field) + " must be between " + std::to_string(min) +
                           " and " + std::to_string(max) + ", got " + std::to_string(value));
  }
}

void requireEmail(const std::string& value) {
  requireText("email", value, limits::kEmail);
  auto at = value.find('@');
  if (at == std::string::npos || at == 0 || at == value.size() - 1) {
    throw BookingError(ErrorKind::INVALID_INPUT, "email is not a valid address");
  }
}

}  // namespace cinema
