#include "sitetrack/core/date.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace sitetrack {
namespace {

// Howard Hinnant's algorithms (public domain):
// https://howardhinnant.github.io/date_algorithms.html
constexpr std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

constexpr Date::YMD civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp + (mp < 10 ? 3 : -9);
  return Date::YMD{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

// Reads exactly `n` ASCII digits at `pos`. Returns -1 on mismatch.
int read_digits(const std::string& s, std::size_t pos, std::size_t n) {
  if (pos + n > s.size()) return -1;
  int v = 0;
  for (std::size_t k = 0; k < n; ++k) {
    const char c = s[pos + k];
    if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
    v = v * 10 + (c - '0');
  }
  return v;
}

const char* const kThaiMonths[12] = {
    "มกราคม", "กุมภาพันธ์", "มีนาคม", "เมษายน", "พฤษภาคม", "มิถุนายน",
    "กรกฎาคม", "สิงหาคม", "กันยายน", "ตุลาคม", "พฤศจิกายน", "ธันวาคม",
};

constexpr int kBuddhistEraOffset = 543;

} // namespace

int days_in_month(int year, int month) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && is_leap(year)) return 29;
  return kDays[month - 1];
}

std::optional<Date> Date::try_from_ymd(int year, int month, int day) {
  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
  return Date(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

Date Date::from_ymd(int year, int month, int day) {
  const auto d = try_from_ymd(year, month, day);
  if (!d) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "invalid calendar date %04d-%02d-%02d", year, month, day);
    throw std::runtime_error(buf);
  }
  return *d;
}

std::optional<Date> Date::parse(const std::string& raw) {
  if (raw.empty()) return std::nullopt;

  // YYYY-MM-DD...
  if (raw.size() >= 10 && raw[4] == '-' && raw[7] == '-') {
    const int y = read_digits(raw, 0, 4);
    const int m = read_digits(raw, 5, 2);
    const int d = read_digits(raw, 8, 2);
    if (y < 0 || m < 0 || d < 0) return std::nullopt;
    return try_from_ymd(y, m, d);
  }

  if (raw.size() >= 8 && raw[2] == '/' && raw[5] == '/') {
    const int d = read_digits(raw, 0, 2);
    const int m = read_digits(raw, 3, 2);
    if (d < 0 || m < 0) return std::nullopt;

    // DD/MM/YYYY...
    const int y4 = read_digits(raw, 6, 4);
    if (y4 >= 0) return try_from_ymd(y4, m, d);

    // DD/MM/YY (whole string only)
    if (raw.size() == 8) {
      const int y2 = read_digits(raw, 6, 2);
      if (y2 >= 0) return try_from_ymd(2000 + y2, m, d);
    }
  }

  return std::nullopt;
}

Date Date::parse_iso_ymd(const std::string& iso) {
  if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
    throw std::runtime_error("Invalid date format, expected YYYY-MM-DD: " + iso);
  }
  const auto d = parse(iso);
  if (!d) throw std::runtime_error("Invalid calendar date: " + iso);
  return *d;
}

Date Date::today() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  return from_ymd(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

Date::YMD Date::to_ymd() const { return civil_from_days(days_); }

int Date::weekday() const {
  // 1970-01-01 was a Thursday (4).
  const std::int64_t w = (days_ % 7 + 7 + 4) % 7;
  return static_cast<int>(w);
}

bool Date::is_weekend() const {
  const int w = weekday();
  return w == 0 || w == 6;
}

Date Date::start_of_month() const {
  const auto ymd = to_ymd();
  return from_ymd(ymd.year, ymd.month, 1);
}

Date Date::end_of_month() const {
  const auto ymd = to_ymd();
  return from_ymd(ymd.year, ymd.month, days_in_month(ymd.year, ymd.month));
}

Date Date::add_months(int months) const {
  const auto ymd = to_ymd();
  const int total = ymd.year * 12 + (ymd.month - 1) + months;
  const int year = (total >= 0 ? total : total - 11) / 12;
  const int month = total - year * 12 + 1;
  const int day = std::min(ymd.day, days_in_month(year, month));
  return from_ymd(year, month, day);
}

std::string Date::to_string() const {
  const auto ymd = to_ymd();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", ymd.year, ymd.month, ymd.day);
  return std::string(buf);
}

std::string Date::to_short_string() const {
  const auto ymd = to_ymd();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d/%02d/%02d", ymd.day, ymd.month, ((ymd.year % 100) + 100) % 100);
  return std::string(buf);
}

std::string Date::to_long_string() const {
  const auto ymd = to_ymd();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", ymd.day, ymd.month, ymd.year);
  return std::string(buf);
}

std::string Date::to_thai_string() const {
  const auto ymd = to_ymd();
  char day[8];
  std::snprintf(day, sizeof(day), "%02d", ymd.day);
  return std::string(day) + " " + kThaiMonths[ymd.month - 1] + " " + std::to_string(ymd.year + kBuddhistEraOffset);
}

std::int64_t duration_days(const Date& start, const Date& end) {
  return std::max<std::int64_t>(0, start.days_until(end) + 1);
}

std::int64_t duration_days(const std::string& start_raw, const std::string& end_raw) {
  const auto s = Date::parse(start_raw);
  const auto e = Date::parse(end_raw);
  if (!s || !e) return 0;
  return duration_days(*s, *e);
}

bool is_overdue(const std::string& raw, double progress, const Date& today) {
  if (progress >= 100.0) return false;
  const auto d = Date::parse(raw);
  return d && *d < today;
}

std::string add_days_to_iso(const std::string& raw, std::int64_t days) {
  const auto d = Date::parse(raw);
  if (!d) return raw;
  return d->add_days(days).to_string();
}

std::string format_optional_date(const std::string& raw) {
  const auto d = Date::parse(raw);
  return d ? d->to_short_string() : "-";
}

std::string format_optional_date_long(const std::string& raw) {
  const auto d = Date::parse(raw);
  return d ? d->to_long_string() : "-";
}

std::string format_date_range(const Date& start, const Date& end) {
  // Raw signed difference, so an inverted range shows up as such in the label.
  const std::int64_t n = start.days_until(end) + 1;
  return start.to_short_string() + " - " + end.to_short_string() + " (" + std::to_string(n) + "d)";
}

std::string format_date_range(const std::string& start_raw, const std::string& end_raw) {
  const auto s = Date::parse(start_raw);
  const auto e = Date::parse(end_raw);
  if (!s || !e) return "-";
  return format_date_range(*s, *e);
}

} // namespace sitetrack
