#pragma once
#include "date_pattern.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace crawlutil {

class Timestamp {
public:
  using clock = std::chrono::system_clock;
  using time_point = std::chrono::time_point<clock, std::chrono::milliseconds>;

  explicit Timestamp(time_point instant, int offset_minutes = 0)
      : instant_(instant), offset_minutes_(offset_minutes) {}

  time_point instant() const { return instant_; }
  int offset_minutes() const { return offset_minutes_; }

  // yyyy-MM-dd во "своём" смещении
  std::string to_iso_date() const;
  // yyyy-MM-ddTHH:mm:ss.SSS+hh:mm (Z для нулевого смещения)
  std::string to_iso() const;
  // yyyy-MM-ddTHH:mm:ss.SSSZ
  std::string to_utc_iso() const;

  friend bool operator==(const Timestamp &a, const Timestamp &b) {
    return a.instant_ == b.instant_;
  }
  friend bool operator!=(const Timestamp &a, const Timestamp &b) {
    return !(a == b);
  }
  friend bool operator<(const Timestamp &a, const Timestamp &b) {
    return a.instant_ < b.instant_;
  }

private:
  time_point instant_;
  int offset_minutes_;
};

// Календарная проверка полей; поля без зоны считаются UTC
std::optional<Timestamp> resolve(const DateFields &fields);

// Встроенные форматы в порядке перебора: ISO-8601, RFC 2822, HTTP, SQL, pom.properties
const std::vector<DatePattern> &builtin_date_patterns();

std::optional<Timestamp>
extract_date(const std::optional<std::string> &text,
             const std::vector<std::string> &formats = {});

std::optional<Timestamp> extract_date(const std::optional<std::string> &text,
                                      const std::vector<std::string> &formats,
                                      Timestamp::time_point now);

} // namespace crawlutil
