#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sitetrack {

// A calendar day with no time-of-day component.
//
// Stored as days since 1970-01-01 (proleptic Gregorian). Dates are always built
// from calendar fields, never from an epoch timestamp, so there is no timezone
// shift when a "YYYY-MM-DD" string is read at local midnight.
class Date {
 public:
  static Date from_days_since_epoch(std::int64_t days_since_epoch) { return Date(days_since_epoch); }

  // Throws std::runtime_error when the fields do not name a real calendar day.
  static Date from_ymd(int year, int month, int day);
  static std::optional<Date> try_from_ymd(int year, int month, int day);

  // Accepts:
  //   YYYY-MM-DD  (prefix match; "2024-01-05T08:00" reads as 2024-01-05)
  //   DD/MM/YYYY  (prefix match)
  //   DD/MM/YY    (exact; year is 2000 + YY)
  // Returns nullopt for anything else, including impossible days like 31/02.
  static std::optional<Date> parse(const std::string& raw);

  // Strict ISO parse. Throws std::runtime_error on failure.
  static Date parse_iso_ymd(const std::string& iso);

  // The local calendar day right now.
  static Date today();

  Date() = default;
  explicit Date(std::int64_t days_since_epoch) : days_(days_since_epoch) {}

  std::int64_t days_since_epoch() const { return days_; }
  Date add_days(std::int64_t delta) const { return Date(days_ + delta); }

  // Signed number of days from this date to `other` (other - this).
  std::int64_t days_until(const Date& other) const { return other.days_ - days_; }

  struct YMD {
    int year;
    int month;
    int day;
  };

  YMD to_ymd() const;

  // 0 = Sunday ... 6 = Saturday.
  int weekday() const;
  bool is_weekend() const;

  Date start_of_month() const;
  Date end_of_month() const;
  // Day-of-month is clamped to the target month's length (Jan 31 + 1 month = Feb 28/29).
  Date add_months(int months) const;

  // YYYY-MM-DD
  std::string to_string() const;
  // dd/MM/yy
  std::string to_short_string() const;
  // dd/MM/yyyy
  std::string to_long_string() const;
  // "15 มกราคม 2568": full Thai month name with a Buddhist Era year.
  std::string to_thai_string() const;

  friend bool operator==(const Date& a, const Date& b) { return a.days_ == b.days_; }
  friend bool operator!=(const Date& a, const Date& b) { return a.days_ != b.days_; }
  friend bool operator<(const Date& a, const Date& b) { return a.days_ < b.days_; }
  friend bool operator<=(const Date& a, const Date& b) { return a.days_ <= b.days_; }
  friend bool operator>(const Date& a, const Date& b) { return a.days_ > b.days_; }
  friend bool operator>=(const Date& a, const Date& b) { return a.days_ >= b.days_; }

 private:
  std::int64_t days_{0};
};

int days_in_month(int year, int month);

// Inclusive calendar-day count: the same day is 1. An inverted range is 0.
std::int64_t duration_days(const Date& start, const Date& end);

// Inclusive duration between two raw date strings; 0 if either fails to parse.
std::int64_t duration_days(const std::string& start_raw, const std::string& end_raw);

inline bool is_same_day(const Date& a, const Date& reference) { return a == reference; }
inline bool is_today(const Date& d, const Date& today) { return is_same_day(d, today); }

// True when `raw` is a valid date strictly before `today` and the work is not
// finished (progress < 100).
bool is_overdue(const std::string& raw, double progress, const Date& today);

// Shifts a raw date string by `days` and returns canonical YYYY-MM-DD.
// An unparseable input is returned unchanged.
std::string add_days_to_iso(const std::string& raw, std::int64_t days);

// Display helpers. Unparseable input renders as "-".
std::string format_optional_date(const std::string& raw);
std::string format_optional_date_long(const std::string& raw);

// "dd/MM/yy - dd/MM/yy (Nd)" with an inclusive day count.
std::string format_date_range(const Date& start, const Date& end);
std::string format_date_range(const std::string& start_raw, const std::string& end_raw);

} // namespace sitetrack
