#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace pc {

inline std::tm toCalendar(std::int64_t epochSeconds, bool utc) {
  auto epoch = static_cast<std::time_t>(epochSeconds);
  std::tm tm{};
  if (utc) {
#ifdef _WIN32
    gmtime_s(&tm, &epoch);
#else
    gmtime_r(&epoch, &tm);
#endif
  } else {
#ifdef _WIN32
    localtime_s(&tm, &epoch);
#else
    localtime_r(&epoch, &tm);
#endif
  }
  return tm;
}

// Format an epoch-seconds timestamp using strftime.
inline std::string formatTimestamp(std::int64_t epochSeconds, const char* fmt, bool utc = false) {
  std::tm tm = toCalendar(epochSeconds, utc);
  char buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

// Tooltip form, "Jan 5, 02:30 PM": short month, unpadded day,
// two-digit 12-hour clock. Local time unless utc is set.
inline std::string formatTooltipTimestamp(std::int64_t epochSeconds, bool utc = false) {
  std::tm tm = toCalendar(epochSeconds, utc);
  char month[16];
  char clock[16];
  std::size_t nm = std::strftime(month, sizeof(month), "%b", &tm);
  std::size_t nc = std::strftime(clock, sizeof(clock), "%I:%M %p", &tm);
  return std::string(month, nm) + " " + std::to_string(tm.tm_mday) + ", " +
         std::string(clock, nc);
}

} // namespace pc
