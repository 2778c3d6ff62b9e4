#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <string>

#include "internal/util/errors.hpp"

namespace curator::util {

namespace {

bool AllDigits(std::string_view text) {
  if (text.empty()) return false;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

int ParseField(std::string_view text, size_t pos, size_t len, int min, int max) {
  const auto field = text.substr(pos, len);
  if (field.size() != len || !AllDigits(field)) {
    throw InvalidArgument("invalid timestamp: " + std::string(text));
  }
  const int value = std::stoi(std::string(field));
  if (value < min || value > max) {
    throw InvalidArgument("timestamp field out of range: " + std::string(text));
  }
  return value;
}

int DaysInMonth(int year, int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const bool           leap    = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  return month == 2 && leap ? 29 : kDays[month - 1];
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::string ToIso8601(TimePoint tp) {
  const auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto       micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
  if (micros < 0) micros = 0;

  const std::time_t t = Clock::to_time_t(secs);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<long>(micros));
  return buf;
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixNanos(int64_t nanos) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

TimePoint ParseTimestamp(std::string_view text) {
  if (AllDigits(text)) {
    if (text.size() > 18) {
      throw InvalidArgument("timestamp out of range: " + std::string(text));
    }
    return FromUnixNanos(std::stoll(std::string(text)));
  }

  // YYYY-MM-DDTHH:MM:SS
  if (text.size() < 20 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') || text[13] != ':' ||
      text[16] != ':' || text.back() != 'Z') {
    throw InvalidArgument("invalid timestamp: " + std::string(text));
  }

  const int year  = ParseField(text, 0, 4, 1970, 9999);
  const int month = ParseField(text, 5, 2, 1, 12);

  std::tm utc{};
  utc.tm_year = year - 1900;
  utc.tm_mon  = month - 1;
  utc.tm_mday = ParseField(text, 8, 2, 1, DaysInMonth(year, month));
  utc.tm_hour = ParseField(text, 11, 2, 0, 23);
  utc.tm_min  = ParseField(text, 14, 2, 0, 59);
  utc.tm_sec  = ParseField(text, 17, 2, 0, 59);

  int64_t nanos = 0;
  if (text.size() > 20) {
    if (text[19] != '.') {
      throw InvalidArgument("invalid timestamp: " + std::string(text));
    }
    auto fraction = text.substr(20, text.size() - 21);
    if (!AllDigits(fraction) || fraction.size() > 9) {
      throw InvalidArgument("invalid timestamp fraction: " + std::string(text));
    }
    std::string padded(fraction);
    padded.resize(9, '0');
    nanos = std::stoll(padded);
  }

  const std::time_t secs = timegm(&utc);
  return FromUnixNanos(static_cast<int64_t>(secs) * 1'000'000'000LL + nanos);
}

} // namespace curator::util
