#include "convlog/common/time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace convlog::common {

std::string format_iso8601(const Timestamp time) {
  const auto t = std::chrono::system_clock::to_time_t(time);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() %
      1000;
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return out.str();
}

std::string now_iso8601() { return format_iso8601(std::chrono::system_clock::now()); }

std::optional<Timestamp> parse_iso8601(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  std::chrono::milliseconds fraction{0};
  std::string rest;
  std::getline(in, rest);
  std::size_t pos = 0;
  if (pos < rest.size() && rest[pos] == '.') {
    ++pos;
    int digits = 0;
    long long millis = 0;
    while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos])) != 0) {
      if (digits < 3) {
        millis = millis * 10 + (rest[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    while (digits < 3) {
      millis *= 10;
      ++digits;
    }
    fraction = std::chrono::milliseconds(millis);
  }

  std::chrono::minutes offset{0};
  if (pos < rest.size() && (rest[pos] == 'Z' || rest[pos] == 'z')) {
    ++pos;
  } else if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
    const int sign = rest[pos] == '-' ? -1 : 1;
    const std::string tz = rest.substr(pos + 1);
    if (tz.size() < 5 || tz[2] != ':' || std::isdigit(static_cast<unsigned char>(tz[0])) == 0 ||
        std::isdigit(static_cast<unsigned char>(tz[1])) == 0 ||
        std::isdigit(static_cast<unsigned char>(tz[3])) == 0 ||
        std::isdigit(static_cast<unsigned char>(tz[4])) == 0) {
      return std::nullopt;
    }
    const int hours = (tz[0] - '0') * 10 + (tz[1] - '0');
    const int minutes = (tz[3] - '0') * 10 + (tz[4] - '0');
    offset = std::chrono::minutes(sign * (hours * 60 + minutes));
    pos += 6;
  }
  if (pos != rest.size()) {
    return std::nullopt;
  }

#ifdef _WIN32
  const std::time_t seconds = _mkgmtime(&tm);
#else
  const std::time_t seconds = timegm(&tm);
#endif
  return std::chrono::system_clock::from_time_t(seconds) + fraction - offset;
}

std::string local_datetime_label(const Timestamp time) {
  const auto t = std::chrono::system_clock::to_time_t(time);
  std::tm local_tm{};
#ifdef _WIN32
  localtime_s(&local_tm, &t);
#else
  localtime_r(&t, &local_tm);
#endif
  std::ostringstream out;
  out << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

} // namespace convlog::common
