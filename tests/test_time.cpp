#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "settlesim/util/time.h"

#define SS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool parse_fails(const std::string& text) {
  try {
    (void)settlesim::parse_iso8601(text);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_time() {
  using settlesim::format_iso8601;
  using settlesim::parse_iso8601;

  const std::int64_t ten_am = 1772359200000LL;  // 2026-03-01T10:00:00Z

  SS_ASSERT(parse_iso8601("2026-03-01T10:00:00Z") == ten_am);
  SS_ASSERT(parse_iso8601("2026-03-01T10:00Z") == ten_am);
  SS_ASSERT(parse_iso8601("2026-03-01 10:00:00") == ten_am);
  SS_ASSERT(parse_iso8601("2026-03-01") == ten_am - 10 * settlesim::kMsPerHour);
  SS_ASSERT(parse_iso8601("2026-03-01T10:04:59.500Z") == ten_am + 299500);
  SS_ASSERT(parse_iso8601("2026-03-01T10:00:00.5Z") == ten_am + 500);
  SS_ASSERT(parse_iso8601("2024-02-29T23:59:59Z") == 1709251199000LL);
  SS_ASSERT(parse_iso8601("1970-01-01T00:00:00Z") == 0);

  SS_ASSERT(format_iso8601(ten_am) == "2026-03-01T10:00:00Z");
  SS_ASSERT(format_iso8601(ten_am + 299500) == "2026-03-01T10:04:59.500Z");
  SS_ASSERT(format_iso8601(-1000) == "1969-12-31T23:59:59Z");
  SS_ASSERT(format_iso8601(-1) == "1969-12-31T23:59:59.999Z");

  // Whole-second floor.
  SS_ASSERT(settlesim::epoch_seconds(1999) == 1);
  SS_ASSERT(settlesim::epoch_seconds(0) == 0);
  SS_ASSERT(settlesim::epoch_seconds(-1) == -1);
  SS_ASSERT(settlesim::epoch_seconds(-1000) == -1);
  SS_ASSERT(settlesim::epoch_seconds(-1001) == -2);

  const auto c = settlesim::civil_from_epoch_ms(ten_am + 299500);
  SS_ASSERT(c.year == 2026 && c.month == 3 && c.day == 1);
  SS_ASSERT(c.hour == 10 && c.minute == 4 && c.second == 59 && c.millisecond == 500);
  SS_ASSERT(settlesim::epoch_ms_from_civil(c) == ten_am + 299500);

  SS_ASSERT(settlesim::format_duration_s(45) == "45s");
  SS_ASSERT(settlesim::format_duration_s(1800) == "30m");
  SS_ASSERT(settlesim::format_duration_s(7200) == "2h");
  SS_ASSERT(settlesim::format_duration_s(5400) == "1h 30m");
  SS_ASSERT(settlesim::format_duration_s(108000) == "1d 6h");
  SS_ASSERT(settlesim::format_duration_s(172800) == "2d");
  SS_ASSERT(settlesim::format_duration_s(-5) == "0s");

  SS_ASSERT(parse_fails(""));
  SS_ASSERT(parse_fails("yesterday"));
  SS_ASSERT(parse_fails("2026-13-01"));
  SS_ASSERT(parse_fails("2026-03-01T25:00:00Z"));
  SS_ASSERT(parse_fails("2026-03-01T10:00:00Zjunk"));
  SS_ASSERT(parse_fails("2026-03-01T10:00:00.Z"));

  return 0;
}
