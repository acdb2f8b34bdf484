#include "layerserve/timestring.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <string_view>
#include <utility>

#include "layerserve/timedef.hpp"

namespace layerserve {

namespace {

constexpr bool IsSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

char* WriteDigits(char* out, unsigned value, int nbDigits) {
  for (int pos = nbDigits - 1; pos >= 0; --pos) {
    out[pos] = static_cast<char>('0' + (value % 10U));
    value /= 10U;
  }
  return out + nbDigits;
}

char* WriteToken(char* out, std::string_view token) { return std::ranges::copy(token, out).out; }

// Digits are expected to have been validated by the caller.
int ReadDigits(const char* ptr, int nbDigits) {
  int value = 0;
  for (int pos = 0; pos < nbDigits; ++pos) {
    value = (value * 10) + (ptr[pos] - '0');
  }
  return value;
}

}  // namespace

char* TimeToStringRFC7231(SysTimePoint tp, char* out) {
  using namespace std::chrono;
  const sys_seconds secTp = floor<seconds>(tp);
  const sys_days dayPoint = floor<days>(secTp);
  const year_month_day ymd{dayPoint};
  const hh_mm_ss hms{secTp - dayPoint};

  out = WriteToken(out, kWeekdayNames[weekday{dayPoint}.c_encoding()]);
  out = WriteToken(out, ", ");
  out = WriteDigits(out, static_cast<unsigned>(ymd.day()), 2);
  *out++ = ' ';
  out = WriteToken(out, kMonthNames[static_cast<unsigned>(ymd.month()) - 1U]);
  *out++ = ' ';
  out = WriteDigits(out, static_cast<unsigned>(static_cast<int>(ymd.year())), 4);
  *out++ = ' ';
  out = WriteDigits(out, static_cast<unsigned>(hms.hours().count()), 2);
  *out++ = ':';
  out = WriteDigits(out, static_cast<unsigned>(hms.minutes().count()), 2);
  *out++ = ':';
  out = WriteDigits(out, static_cast<unsigned>(hms.seconds().count()), 2);
  return WriteToken(out, " GMT");
}

SysTimePoint TryParseTimeRFC7231(const char* begPtr, const char* endPtr) {
  while (begPtr < endPtr && IsSpace(*begPtr)) {
    ++begPtr;
  }
  while (endPtr > begPtr && IsSpace(*(endPtr - 1))) {
    --endPtr;
  }

  if (std::cmp_not_equal(endPtr - begPtr, kRFC7231DateStrLen)) {
    return kInvalidTimePoint;  // Expect strict IMF-fixdate form
  }

  const char* ptr = begPtr;
  if (ptr[3] != ',' || ptr[4] != ' ' || ptr[7] != ' ' || ptr[11] != ' ' || ptr[16] != ' ' || ptr[19] != ':' ||
      ptr[22] != ':' || ptr[25] != ' ') {
    return kInvalidTimePoint;
  }

  static constexpr std::size_t kDigitPositions[] = {5, 6, 12, 13, 14, 15, 17, 18, 20, 21, 23, 24};
  if (!std::ranges::all_of(kDigitPositions, [ptr](std::size_t pos) { return IsDigit(ptr[pos]); })) {
    return kInvalidTimePoint;
  }

  if (std::string_view(ptr + 26, 3) != "GMT") {
    return kInvalidTimePoint;
  }

  const auto monthIt = std::ranges::find(kMonthNames, std::string_view(ptr + 8, 3));
  if (monthIt == std::end(kMonthNames)) {
    return kInvalidTimePoint;
  }
  const auto weekdayIt = std::ranges::find(kWeekdayNames, std::string_view(ptr, 3));
  if (weekdayIt == std::end(kWeekdayNames)) {
    return kInvalidTimePoint;
  }

  const int dayValue = ReadDigits(ptr + 5, 2);
  const int yearValue = ReadDigits(ptr + 12, 4);
  const int hourValue = ReadDigits(ptr + 17, 2);
  const int minuteValue = ReadDigits(ptr + 20, 2);
  const int secondValue = ReadDigits(ptr + 23, 2);

  if (hourValue > 23 || minuteValue > 59 || secondValue > 60) {
    return kInvalidTimePoint;
  }

  // kMonthNames is 0-based, std::chrono::month is 1-based.
  const std::chrono::year_month_day ymd{
      std::chrono::year{yearValue},
      std::chrono::month{static_cast<unsigned>(std::distance(std::begin(kMonthNames), monthIt)) + 1U},
      std::chrono::day{static_cast<unsigned>(dayValue)}};
  if (!ymd.ok()) {
    return kInvalidTimePoint;
  }

  const std::chrono::sys_days dayPoint{ymd};
  // the weekday token must match the computed weekday for the date
  if (std::cmp_not_equal(std::distance(std::begin(kWeekdayNames), weekdayIt),
                         std::chrono::weekday{dayPoint}.c_encoding())) {
    return kInvalidTimePoint;
  }

  return dayPoint + std::chrono::hours{hourValue} + std::chrono::minutes{minuteValue} +
         std::chrono::seconds{secondValue};
}

}  // namespace layerserve
