#include <crawlutil/date.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <ctime>
#include <utility>

namespace crawlutil {

using std::chrono::milliseconds;

static constexpr const char *kBuiltinFormats[] = {
    // ISO-8601
    "yyyy-MM-dd'T'HH:mm:ss.uX",
    "yyyy-MM-dd'T'HH:mm:ss.u",
    "yyyy-MM-dd'T'HH:mm:ssX",
    "yyyy-MM-dd'T'HH:mm:ss",
    "yyyy-MM-dd'T'HH:mmX",
    "yyyy-MM-dd'T'HH:mm",
    "yyyy-MM-dd",
    "yyyy-MM",
    "yyyyMMdd",
    // RFC 2822
    "EEE, d MMM yyyy HH:mm:ss ZZZ",
    "EEE, d MMM yyyy HH:mm:ss z",
    "EEE, d MMM yyyy HH:mm ZZZ",
    "EEE, d MMM yyyy HH:mm z",
    "d MMM yyyy HH:mm:ss ZZZ",
    "d MMM yyyy HH:mm:ss z",
    "d MMM yyyy HH:mm ZZZ",
    "d MMM yyyy HH:mm z",
    // HTTP: RFC 1123, RFC 850, asctime
    "EEE, dd MMM yyyy HH:mm:ss 'GMT'",
    "EEEE, dd-MMM-yy HH:mm:ss 'GMT'",
    "EEE MMM d HH:mm:ss yyyy",
    // SQL
    "yyyy-MM-dd HH:mm:ss.u X",
    "yyyy-MM-dd HH:mm:ss.uX",
    "yyyy-MM-dd HH:mm:ss X",
    "yyyy-MM-dd HH:mm:ssX",
    "yyyy-MM-dd HH:mm:ss.u",
    "yyyy-MM-dd HH:mm:ss",
    "yyyy-MM-dd HH:mm",
    // pom.properties (java.util.Date#toString с GMT-смещением)
    "EEE MMM d HH:mm:ss 'GMT'ZZ yyyy",
};

static bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static int days_in_month(int y, int m) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && is_leap(y) ? 29 : kDays[m - 1];
}

static std::tm split(Timestamp::time_point tp, int offset_minutes, int &ms) {
  long long local = tp.time_since_epoch().count() +
                    static_cast<long long>(offset_minutes) * 60000LL;
  long long secs = local / 1000;
  if (local % 1000 < 0)
    --secs;
  ms = static_cast<int>(local - secs * 1000);
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

static std::string format_offset(int offset_minutes) {
  if (offset_minutes == 0)
    return "Z";
  const int a = std::abs(offset_minutes);
  return fmt::format("{}{:02}:{:02}", offset_minutes < 0 ? '-' : '+', a / 60,
                     a % 60);
}

std::string Timestamp::to_iso_date() const {
  int ms = 0;
  std::tm tm = split(instant_, offset_minutes_, ms);
  return fmt::format("{:04}-{:02}-{:02}", tm.tm_year + 1900, tm.tm_mon + 1,
                     tm.tm_mday);
}

std::string Timestamp::to_iso() const {
  int ms = 0;
  std::tm tm = split(instant_, offset_minutes_, ms);
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}{}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, ms, format_offset(offset_minutes_));
}

std::string Timestamp::to_utc_iso() const {
  return Timestamp(instant_, 0).to_iso();
}

std::optional<Timestamp> resolve(const DateFields &f) {
  if (!f.year)
    return std::nullopt;
  const int year = *f.year;
  const int month = f.month.value_or(1);
  const int day = f.day.value_or(1);

  int hour = 0;
  if (f.hour) {
    hour = *f.hour;
  } else if (f.hour12) {
    if (*f.hour12 < 1 || *f.hour12 > 12)
      return std::nullopt;
    hour = f.pm ? *f.hour12 % 12 + (*f.pm ? 12 : 0) : *f.hour12;
  }
  const int minute = f.minute.value_or(0);
  const int second = f.second.value_or(0);
  const int ms = f.millisecond.value_or(0);
  const int offset = f.offset_minutes.value_or(0);

  if (month < 1 || month > 12)
    return std::nullopt;
  if (day < 1 || day > days_in_month(year, month))
    return std::nullopt;
  if (hour > 23 || minute > 59 || second > 59 || ms > 999)
    return std::nullopt;
  if (std::abs(offset) > 18 * 60)
    return std::nullopt;

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  const std::time_t secs = timegm(&tm);

  // timegm заполняет tm_wday
  if (f.weekday) {
    const int iso_wday = tm.tm_wday == 0 ? 7 : tm.tm_wday;
    if (*f.weekday != iso_wday)
      return std::nullopt;
  }

  Timestamp::time_point tp{std::chrono::seconds(
      static_cast<long long>(secs) - static_cast<long long>(offset) * 60)};
  tp += milliseconds(ms);
  return Timestamp(tp, offset);
}

const std::vector<DatePattern> &builtin_date_patterns() {
  static const std::vector<DatePattern> patterns = [] {
    std::vector<DatePattern> out;
    for (const char *f : kBuiltinFormats) {
      if (auto p = DatePattern::compile(f))
        out.push_back(std::move(*p));
    }
    return out;
  }();
  return patterns;
}

static std::string trim(const std::string &s) {
  static constexpr char ws[] = " \t\r\n";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return "";
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::optional<Timestamp> extract_date(const std::optional<std::string> &text,
                                      const std::vector<std::string> &formats) {
  return extract_date(
      text, formats,
      std::chrono::time_point_cast<milliseconds>(Timestamp::clock::now()));
}

std::optional<Timestamp> extract_date(const std::optional<std::string> &text,
                                      const std::vector<std::string> &formats,
                                      Timestamp::time_point now) {
  if (!text)
    return std::nullopt;
  const std::string s = trim(*text);
  if (s.empty())
    return std::nullopt;

  auto attempt = [&](const DatePattern &p) -> std::optional<Timestamp> {
    auto fields = p.match(s);
    if (!fields)
      return std::nullopt;
    auto ts = resolve(*fields);
    if (!ts) {
      spdlog::trace("[date] '{}' matches '{}' but fields are out of range", s,
                    p.source());
      return std::nullopt;
    }
    if (ts->instant() > now) {
      spdlog::trace("[date] '{}' via '{}' is in the future ({}), skipped", s,
                    p.source(), ts->to_utc_iso());
      return std::nullopt;
    }
    return ts;
  };

  for (const auto &f : formats) {
    auto p = DatePattern::compile(f);
    if (!p) {
      spdlog::debug("[date] malformed format '{}' ignored", f);
      continue;
    }
    if (auto ts = attempt(*p))
      return ts;
  }
  for (const auto &p : builtin_date_patterns()) {
    if (auto ts = attempt(p))
      return ts;
  }
  spdlog::trace("[date] no format matched '{}'", s);
  return std::nullopt;
}

} // namespace crawlutil
