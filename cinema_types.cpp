#include "cinema_types.hpp"

namespace cinema {

AccountView AccountView::from(const Account& account) {
  AccountView view;
  view.id = account.id;
  view.display_name = account.display_name;
  view.email = account.email;
  view.login_name = account.login_name;
  view.phone = account.phone;
  view.role = account.role;
  view.created_at = account.created_at;
  view.active = account.active;
  return view;
}

BookingStatus applyBookingEvent(BookingStatus current, BookingEvent event) {
  if (current != BookingStatus::ACTIVE) {
    return current;
  }
  switch (event) {
    case BookingEvent::CANCEL: return BookingStatus::CANCELLED;
    case BookingEvent::EXPIRE: return BookingStatus::EXPIRED;
  }
  return current;
}

std::string toString(AccountRole role) {
  switch (role) {
    case AccountRole::CUSTOMER: return "CUSTOMER";
    case AccountRole::ADMIN: return "ADMIN";
  }
  return "UNKNOWN";
}

std::string toString(BookingStatus status) {
  switch (status) {
    case BookingStatus::ACTIVE: return "ACTIVE";
    case BookingStatus::CANCELLED: return "CANCELLED";
    case BookingStatus::EXPIRED: return "EXPIRED";
  }
  return "UNKNOWN";
}

std::string toString(BookingEvent event) {
  switch (event) {
    case BookingEvent::CANCEL: return "CANCEL";
    case BookingEvent::EXPIRE: return "EXPIRE";
  }
  return "UNKNOWN";
}

std::string toString(PaymentMethod method) {
  switch (method) {
    case PaymentMethod::CARD: return "CARD";
    case PaymentMethod::EWALLET: return "EWALLET";
    case PaymentMethod::BANK_TRANSFER: return "BANK_TRANSFER";
  }
  return "UNKNOWN";
}

std::string toString(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::PENDING: return "PENDING";
    case PaymentStatus::SUCCESS: return "SUCCESS";
    case PaymentStatus::FAILED: return "FAILED";
  }
  return "UNKNOWN";
}

std::optional<AccountRole> parseAccountRole(const std::string& text) {
  if (text == "CUSTOMER") return AccountRole::CUSTOMER;
  if (text == "ADMIN") return AccountRole::ADMIN;
  return std::nullopt;
}

std::optional<BookingStatus> parseBookingStatus(const std::string& text) {
  if (text == "ACTIVE") return BookingStatus::ACTIVE;
  if (text == "CANCELLED") return BookingStatus::CANCELLED;
  if (text == "EXPIRED") return BookingStatus::EXPIRED;
  return std::nullopt;
}

std::optional<PaymentMethod> parsePaymentMethod(const std::string& text) {
  if (text == "CARD") return PaymentMethod::CARD;
  if (text == "EWALLET") return PaymentMethod::EWALLET;
  if (text == "BANK_TRANSFER") return PaymentMethod::BANK_TRANSFER;
  return std::nullopt;
}

std::optional<PaymentStatus> parsePaymentStatus(const std::string& text) {
  if (text == "PENDING") return PaymentStatus::PENDING;
  if (text == "SUCCESS") return PaymentStatus::SUCCESS;
  if (text == "FAILED") return PaymentStatus::FAILED;
  return std::nullopt;
}

}  // namespace cinema
