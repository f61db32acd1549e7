#include "settlesim/util/time.h"

#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace settlesim {
namespace {

// Howard Hinnant's algorithms (public domain):
// https://howardhinnant.github.io/date_algorithms.html
// days_from_civil returns days since 1970-01-01.
constexpr std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, int* y_out, int* m_out, int* d_out) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp + (mp < 10 ? 3 : -9);
  *y_out = static_cast<int>(y + (m <= 2));
  *m_out = static_cast<int>(m);
  *d_out = static_cast<int>(d);
}

constexpr std::int64_t kMsPerDay = 24 * kMsPerHour;

int parse_digits(const std::string& s, std::size_t pos, std::size_t count) {
  if (pos + count > s.size()) throw std::runtime_error("Invalid timestamp (truncated): " + s);
  int v = 0;
  for (std::size_t k = 0; k < count; ++k) {
    const char c = s[pos + k];
    if (c < '0' || c > '9') throw std::runtime_error("Invalid timestamp (expected digit): " + s);
    v = v * 10 + (c - '0');
  }
  return v;
}

} // namespace

std::int64_t now_epoch_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t epoch_ms_from_civil(const CivilTime& t) {
  if (t.month < 1 || t.month > 12) throw std::runtime_error("month out of range");
  if (t.day < 1 || t.day > 31) throw std::runtime_error("day out of range");
  if (t.hour < 0 || t.hour > 23) throw std::runtime_error("hour out of range");
  if (t.minute < 0 || t.minute > 59) throw std::runtime_error("minute out of range");
  if (t.second < 0 || t.second > 59) throw std::runtime_error("second out of range");
  const std::int64_t days =
      days_from_civil(t.year, static_cast<unsigned>(t.month), static_cast<unsigned>(t.day));
  return days * kMsPerDay + t.hour * kMsPerHour + t.minute * kMsPerMinute + t.second * kMsPerSecond +
         t.millisecond;
}

CivilTime civil_from_epoch_ms(std::int64_t epoch_ms) {
  std::int64_t days = epoch_ms / kMsPerDay;
  std::int64_t rem = epoch_ms % kMsPerDay;
  if (rem < 0) {
    rem += kMsPerDay;
    --days;
  }
  CivilTime t;
  civil_from_days(days, &t.year, &t.month, &t.day);
  t.hour = static_cast<int>(rem / kMsPerHour);
  rem %= kMsPerHour;
  t.minute = static_cast<int>(rem / kMsPerMinute);
  rem %= kMsPerMinute;
  t.second = static_cast<int>(rem / kMsPerSecond);
  t.millisecond = static_cast<int>(rem % kMsPerSecond);
  return t;
}

std::string format_iso8601(std::int64_t epoch_ms) {
  const CivilTime t = civil_from_epoch_ms(epoch_ms);
  char buf[48];
  if (t.millisecond != 0) {
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", t.year, t.month, t.day, t.hour,
                  t.minute, t.second, t.millisecond);
  } else {
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", t.year, t.month, t.day, t.hour, t.minute,
                  t.second);
  }
  return std::string(buf);
}

std::int64_t parse_iso8601(const std::string& text) {
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    throw std::runtime_error("Invalid timestamp, expected YYYY-MM-DD[THH:MM[:SS]]Z: " + text);
  }
  CivilTime t;
  t.year = parse_digits(text, 0, 4);
  t.month = parse_digits(text, 5, 2);
  t.day = parse_digits(text, 8, 2);

  std::size_t pos = 10;
  if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
    t.hour = parse_digits(text, pos + 1, 2);
    if (pos + 3 >= text.size() || text[pos + 3] != ':') throw std::runtime_error("Invalid timestamp: " + text);
    t.minute = parse_digits(text, pos + 4, 2);
    pos += 6;
    if (pos < text.size() && text[pos] == ':') {
      t.second = parse_digits(text, pos + 1, 2);
      pos += 3;
      if (pos < text.size() && text[pos] == '.') {
        std::size_t digits = 0;
        int ms = 0;
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
          if (digits < 3) ms = ms * 10 + (text[pos] - '0');
          ++digits;
          ++pos;
        }
        if (digits == 0) throw std::runtime_error("Invalid timestamp fraction: " + text);
        for (std::size_t k = digits; k < 3; ++k) ms *= 10;
        t.millisecond = ms;
      }
    }
  }
  if (pos < text.size() && text[pos] == 'Z') ++pos;
  if (pos != text.size()) throw std::runtime_error("Trailing characters in timestamp: " + text);
  return epoch_ms_from_civil(t);
}

std::string format_duration_s(std::int64_t seconds) {
  if (seconds < 0) seconds = 0;
  char buf[48];
  if (seconds < 60) {
    std::snprintf(buf, sizeof(buf), "%llds", static_cast<long long>(seconds));
  } else if (seconds < 3600) {
    std::snprintf(buf, sizeof(buf), "%lldm", static_cast<long long>(seconds / 60));
  } else if (seconds < 86400) {
    const long long h = seconds / 3600;
    const long long m = (seconds % 3600) / 60;
    if (m != 0) {
      std::snprintf(buf, sizeof(buf), "%lldh %lldm", h, m);
    } else {
      std::snprintf(buf, sizeof(buf), "%lldh", h);
    }
  } else {
    const long long d = seconds / 86400;
    const long long h = (seconds % 86400) / 3600;
    if (h != 0) {
      std::snprintf(buf, sizeof(buf), "%lldd %lldh", d, h);
    } else {
      std::snprintf(buf, sizeof(buf), "%lldd", d);
    }
  }
  return std::string(buf);
}

} // namespace settlesim
