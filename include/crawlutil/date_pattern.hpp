#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crawlutil {

// Поля, извлечённые из строки; проверка диапазонов - в resolve()
struct DateFields {
  std::optional<int> year;
  std::optional<int> month;
  std::optional<int> day;
  std::optional<int> hour;
  std::optional<int> hour12;
  std::optional<bool> pm;
  std::optional<int> minute;
  std::optional<int> second;
  std::optional<int> millisecond;
  std::optional<int> weekday; // 1..7, Monday=1
  std::optional<int> offset_minutes;
};

/**
 * Date format in Luxon / TR35 notation, e.g. "EEE MMM d HH:mm:ss 'GMT'ZZ yyyy".
 * A space matches a run of whitespace, names are matched case-insensitively
 * and the whole input has to be consumed.
 */
class DatePattern {
public:
  static std::optional<DatePattern> compile(std::string_view pattern);

  std::optional<DateFields> match(std::string_view text) const;

  const std::string &source() const { return source_; }

private:
  enum class Tok {
    Literal,
    Space,
    Year4,
    Year2,
    YearN,
    Month2,
    Month,
    MonthShort,
    MonthLong,
    Day2,
    Day,
    Hour24_2,
    Hour24,
    Hour12_2,
    Hour12,
    Meridiem,
    Minute2,
    Minute,
    Second2,
    Second,
    Millis3,
    Millis,
    Fraction,
    WeekdayNum,
    WeekdayShort,
    WeekdayLong,
    Offset,
    OffsetCompact,
    ZoneName,
    IsoZone,
  };

  struct Part {
    Tok tok;
    std::string text; // только для Literal
  };

  std::string source_;
  std::vector<Part> parts_;

  static std::optional<Tok> token_for(char letter, std::size_t count);
  static bool match_part(const Part &part, std::string_view text,
                         std::size_t &pos, DateFields &out);
};

// Смещение для имени зоны (UTC, GMT, EST...), nullopt для неизвестных
std::optional<int> zone_offset_minutes(std::string_view name);

} // namespace crawlutil
