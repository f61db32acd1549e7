#pragma once

#include <cstdint>
#include <string>

namespace settlesim {

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;

// Wall clock, milliseconds since 1970-01-01T00:00:00Z.
std::int64_t now_epoch_ms();

// floor(ms / 1000), correct for negative inputs.
inline std::int64_t epoch_seconds(std::int64_t epoch_ms) {
  std::int64_t s = epoch_ms / kMsPerSecond;
  if (epoch_ms % kMsPerSecond < 0) --s;
  return s;
}

struct CivilTime {
  int year{1970};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};
  int millisecond{0};
};

std::int64_t epoch_ms_from_civil(const CivilTime& t);
CivilTime civil_from_epoch_ms(std::int64_t epoch_ms);

// "YYYY-MM-DDTHH:MM:SSZ", with ".mmm" when the millisecond part is non-zero.
std::string format_iso8601(std::int64_t epoch_ms);

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.mmm]][Z]" and the same with a space separator.
// Throws std::runtime_error on malformed input.
std::int64_t parse_iso8601(const std::string& text);

// Compact human duration for event messages: "45s", "30m", "2h", "1d 6h".
std::string format_duration_s(std::int64_t seconds);

} // namespace settlesim
