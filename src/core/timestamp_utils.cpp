#include "core/timestamp_utils.h"
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimestampUtils {

namespace {
constexpr int64_t kNanosPerSecond = 1000000000LL;
}

std::string toIso8601(const Timestamp &ts) {
  int64_t total_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         ts.time_since_epoch())
                         .count();
  int64_t secs = total_ns / kNanosPerSecond;
  int64_t frac = total_ns % kNanosPerSecond;
  if (frac < 0) {
    frac += kNanosPerSecond;
    secs -= 1;
  }

  std::time_t time_t_value = static_cast<std::time_t>(secs);
  std::tm tm_value{};
  gmtime_r(&time_t_value, &tm_value);

  std::ostringstream ss;
  ss << std::put_time(&tm_value, "%Y-%m-%dT%H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(9) << frac << 'Z';
  return ss.str();
}

std::optional<Timestamp> fromIso8601(const std::string &text) {
  // Shortest accepted form: YYYY-MM-DDTHH:MM:SS
  if (text.size() < 19) {
    return std::nullopt;
  }

  std::tm tm_value{};
  std::istringstream iss(text.substr(0, 19));
  iss >> std::get_time(&tm_value, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }

  size_t pos = 19;
  int64_t frac = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits == 9) {
        return std::nullopt;
      }
      frac = frac * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 9; ++digits) {
      frac *= 10;
    }
  }

  std::string suffix = text.substr(pos);
  if (!suffix.empty() && suffix != "Z" && suffix != "+00:00") {
    return std::nullopt;
  }

  std::time_t secs = timegm(&tm_value);
  if (secs == static_cast<std::time_t>(-1) &&
      text.compare(0, 19, "1969-12-31T23:59:59") != 0) {
    return std::nullopt;
  }

  std::chrono::nanoseconds since_epoch(static_cast<int64_t>(secs) *
                                           kNanosPerSecond +
                                       frac);
  return Timestamp(
      std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

} // namespace TimestampUtils
