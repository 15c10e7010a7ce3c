#include <crawlutil/date_pattern.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace crawlutil {

static constexpr std::array<const char *, 12> kMonthsShort = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
static constexpr std::array<const char *, 12> kMonthsLong = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};
static constexpr std::array<const char *, 7> kWeekdaysShort = {
    "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
static constexpr std::array<const char *, 7> kWeekdaysLong = {
    "Monday", "Tuesday", "Wednesday", "Thursday",
    "Friday", "Saturday", "Sunday"};

// RFC 822 + UTC-алиасы; остальные аббревиатуры (CEST, MSK...) не принимаем
static constexpr std::array<std::pair<const char *, int>, 14> kZones = {{
    {"UTC", 0},
    {"UT", 0},
    {"GMT", 0},
    {"Z", 0},
    {"ETC/UTC", 0},
    {"ETC/GMT", 0},
    {"EST", -5 * 60},
    {"EDT", -4 * 60},
    {"CST", -6 * 60},
    {"CDT", -5 * 60},
    {"MST", -7 * 60},
    {"MDT", -6 * 60},
    {"PST", -8 * 60},
    {"PDT", -7 * 60},
}};

static char upper(char c) {
  return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

static bool ieq_at(std::string_view text, std::size_t pos,
                   std::string_view word) {
  if (text.size() - pos < word.size())
    return false;
  for (std::size_t i = 0; i < word.size(); ++i)
    if (upper(text[pos + i]) != upper(word[i]))
      return false;
  return true;
}

std::optional<int> zone_offset_minutes(std::string_view name) {
  for (const auto &[zone, offset] : kZones) {
    std::string_view z(zone);
    if (z.size() == name.size() && ieq_at(name, 0, z))
      return offset;
  }
  return std::nullopt;
}

static bool read_digits(std::string_view text, std::size_t &pos,
                        std::size_t min, std::size_t max, int &out) {
  std::size_t n = 0;
  int v = 0;
  while (n < max && pos + n < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[pos + n]))) {
    v = v * 10 + (text[pos + n] - '0');
    ++n;
  }
  if (n < min)
    return false;
  pos += n;
  out = v;
  return true;
}

template <std::size_t N>
static std::optional<int> read_name(std::string_view text, std::size_t &pos,
                                    const std::array<const char *, N> &names) {
  for (std::size_t i = 0; i < N; ++i) {
    std::string_view w(names[i]);
    if (ieq_at(text, pos, w)) {
      pos += w.size();
      return static_cast<int>(i) + 1;
    }
  }
  return std::nullopt;
}

// [+-]h[h][:mm] или, при compact, [+-]hh[mm]
static bool read_offset(std::string_view text, std::size_t &pos, bool compact,
                        int &out) {
  if (pos >= text.size() || (text[pos] != '+' && text[pos] != '-'))
    return false;
  const int sign = text[pos] == '-' ? -1 : 1;
  std::size_t p = pos + 1;
  int hh = 0, mm = 0;
  if (!read_digits(text, p, compact ? 2 : 1, 2, hh))
    return false;
  if (compact) {
    std::size_t q = p;
    if (read_digits(text, q, 2, 2, mm))
      p = q;
  } else if (p < text.size() && text[p] == ':') {
    ++p;
    if (!read_digits(text, p, 2, 2, mm))
      return false;
  }
  if (mm > 59)
    return false;
  out = sign * (hh * 60 + mm);
  pos = p;
  return true;
}

static bool read_zone_name(std::string_view text, std::size_t &pos,
                           int &out) {
  std::size_t p = pos;
  while (p < text.size() &&
         (std::isalpha(static_cast<unsigned char>(text[p])) || text[p] == '/' ||
          text[p] == '_'))
    ++p;
  if (p == pos)
    return false;
  auto z = zone_offset_minutes(text.substr(pos, p - pos));
  if (!z)
    return false;
  out = *z;
  pos = p;
  return true;
}

std::optional<DatePattern::Tok> DatePattern::token_for(char letter,
                                                       std::size_t count) {
  switch (letter) {
  case 'y':
    if (count == 2)
      return Tok::Year2;
    if (count == 4)
      return Tok::Year4;
    return Tok::YearN;
  case 'M':
  case 'L':
    if (count == 1)
      return Tok::Month;
    if (count == 2)
      return Tok::Month2;
    if (count == 3)
      return Tok::MonthShort;
    return Tok::MonthLong;
  case 'd':
    return count == 1 ? Tok::Day : Tok::Day2;
  case 'H':
    return count == 1 ? Tok::Hour24 : Tok::Hour24_2;
  case 'h':
    return count == 1 ? Tok::Hour12 : Tok::Hour12_2;
  case 'a':
    return Tok::Meridiem;
  case 'm':
    return count == 1 ? Tok::Minute : Tok::Minute2;
  case 's':
    return count == 1 ? Tok::Second : Tok::Second2;
  case 'S':
    return count == 3 ? Tok::Millis3 : Tok::Millis;
  case 'u':
    return Tok::Fraction;
  case 'E':
    if (count <= 2)
      return Tok::WeekdayNum;
    return count == 3 ? Tok::WeekdayShort : Tok::WeekdayLong;
  case 'Z':
    return count == 3 ? Tok::OffsetCompact : Tok::Offset;
  case 'z':
    return Tok::ZoneName;
  case 'X':
    return Tok::IsoZone;
  default:
    return std::nullopt;
  }
}

std::optional<DatePattern> DatePattern::compile(std::string_view pat) {
  DatePattern dp;
  dp.source_ = std::string(pat);

  std::string lit;
  auto flush = [&] {
    if (!lit.empty()) {
      dp.parts_.push_back(Part{Tok::Literal, lit});
      lit.clear();
    }
  };

  std::size_t i = 0;
  while (i < pat.size()) {
    const char c = pat[i];
    if (c == '\'') {
      std::size_t j = i + 1;
      bool closed = false;
      while (j < pat.size()) {
        if (pat[j] == '\'') {
          if (j + 1 < pat.size() && pat[j + 1] == '\'') {
            lit.push_back('\'');
            j += 2;
            continue;
          }
          closed = true;
          break;
        }
        lit.push_back(pat[j++]);
      }
      if (!closed)
        return std::nullopt;
      // '' вне кавычек - одиночная кавычка
      if (j == i + 1)
        lit.push_back('\'');
      i = j + 1;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      flush();
      if (dp.parts_.empty() || dp.parts_.back().tok != Tok::Space)
        dp.parts_.push_back(Part{Tok::Space, {}});
      ++i;
      continue;
    }
    if (std::isalpha(static_cast<unsigned char>(c))) {
      std::size_t n = 1;
      while (i + n < pat.size() && pat[i + n] == c)
        ++n;
      if (auto tok = token_for(c, n)) {
        flush();
        dp.parts_.push_back(Part{*tok, {}});
      } else {
        lit.append(n, c);
      }
      i += n;
      continue;
    }
    lit.push_back(c);
    ++i;
  }
  flush();

  if (dp.parts_.empty())
    return std::nullopt;
  return dp;
}

bool DatePattern::match_part(const Part &part, std::string_view text,
                             std::size_t &pos, DateFields &out) {
  int v = 0;
  switch (part.tok) {
  case Tok::Literal:
    if (!ieq_at(text, pos, part.text))
      return false;
    pos += part.text.size();
    return true;
  case Tok::Space:
    if (pos >= text.size() ||
        !std::isspace(static_cast<unsigned char>(text[pos])))
      return false;
    while (pos < text.size() &&
           std::isspace(static_cast<unsigned char>(text[pos])))
      ++pos;
    return true;
  case Tok::Year4:
    if (!read_digits(text, pos, 4, 4, v))
      return false;
    out.year = v;
    return true;
  case Tok::Year2:
    if (!read_digits(text, pos, 2, 2, v))
      return false;
    out.year = v > 60 ? 1900 + v : 2000 + v;
    return true;
  case Tok::YearN:
    if (!read_digits(text, pos, 1, 6, v))
      return false;
    out.year = v;
    return true;
  case Tok::Month2:
  case Tok::Month:
    if (!read_digits(text, pos, part.tok == Tok::Month2 ? 2 : 1, 2, v))
      return false;
    out.month = v;
    return true;
  case Tok::MonthShort:
    out.month = read_name(text, pos, kMonthsShort);
    return out.month.has_value();
  case Tok::MonthLong:
    out.month = read_name(text, pos, kMonthsLong);
    return out.month.has_value();
  case Tok::Day2:
  case Tok::Day:
    if (!read_digits(text, pos, part.tok == Tok::Day2 ? 2 : 1, 2, v))
      return false;
    out.day = v;
    return true;
  case Tok::Hour24_2:
  case Tok::Hour24:
    if (!read_digits(text, pos, part.tok == Tok::Hour24_2 ? 2 : 1, 2, v))
      return false;
    out.hour = v;
    return true;
  case Tok::Hour12_2:
  case Tok::Hour12:
    if (!read_digits(text, pos, part.tok == Tok::Hour12_2 ? 2 : 1, 2, v))
      return false;
    out.hour12 = v;
    return true;
  case Tok::Meridiem:
    if (ieq_at(text, pos, "AM"))
      out.pm = false;
    else if (ieq_at(text, pos, "PM"))
      out.pm = true;
    else
      return false;
    pos += 2;
    return true;
  case Tok::Minute2:
  case Tok::Minute:
    if (!read_digits(text, pos, part.tok == Tok::Minute2 ? 2 : 1, 2, v))
      return false;
    out.minute = v;
    return true;
  case Tok::Second2:
  case Tok::Second:
    if (!read_digits(text, pos, part.tok == Tok::Second2 ? 2 : 1, 2, v))
      return false;
    out.second = v;
    return true;
  case Tok::Millis3:
  case Tok::Millis:
    if (!read_digits(text, pos, part.tok == Tok::Millis3 ? 3 : 1, 3, v))
      return false;
    out.millisecond = v;
    return true;
  case Tok::Fraction: {
    // 1..9 цифр, точность обрезается до миллисекунд
    std::size_t start = pos;
    if (!read_digits(text, pos, 1, 9, v))
      return false;
    int ms = 0;
    for (std::size_t k = 0; k < 3; ++k) {
      ms *= 10;
      if (start + k < pos)
        ms += text[start + k] - '0';
    }
    out.millisecond = ms;
    return true;
  }
  case Tok::WeekdayNum:
    if (!read_digits(text, pos, 1, 1, v))
      return false;
    out.weekday = v;
    return true;
  case Tok::WeekdayShort:
    out.weekday = read_name(text, pos, kWeekdaysShort);
    return out.weekday.has_value();
  case Tok::WeekdayLong:
    out.weekday = read_name(text, pos, kWeekdaysLong);
    return out.weekday.has_value();
  case Tok::Offset:
  case Tok::OffsetCompact:
    if (!read_offset(text, pos, part.tok == Tok::OffsetCompact, v))
      return false;
    out.offset_minutes = v;
    return true;
  case Tok::ZoneName:
    if (!read_zone_name(text, pos, v))
      return false;
    out.offset_minutes = v;
    return true;
  case Tok::IsoZone:
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      std::size_t p = pos;
      // +hh:mm, +hhmm, +hh
      if (!read_offset(text, p, false, v)) {
        p = pos;
        if (!read_offset(text, p, true, v))
          return false;
      } else if (p < text.size() &&
                 std::isdigit(static_cast<unsigned char>(text[p]))) {
        p = pos;
        if (!read_offset(text, p, true, v))
          return false;
      }
      pos = p;
    } else if (!read_zone_name(text, pos, v)) {
      return false;
    }
    out.offset_minutes = v;
    return true;
  }
  return false;
}

std::optional<DateFields> DatePattern::match(std::string_view text) const {
  DateFields f;
  std::size_t pos = 0;
  for (const auto &part : parts_) {
    if (!match_part(part, text, pos, f))
      return std::nullopt;
  }
  if (pos != text.size())
    return std::nullopt;
  return f;
}

} // namespace crawlutil
