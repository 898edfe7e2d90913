#include "paschen/timestamps.hpp"

#include "paschen/utils.hpp"

#include <cstdio>
#include <filesystem>

namespace paschen {

namespace {

static bool is_leap_year(int y) {
  if (y % 4 != 0) return false;
  if (y % 100 != 0) return true;
  return (y % 400 == 0);
}

static int days_in_month(int y, int m) {
  static const int mdays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m < 1 || m > 12) return 0;
  if (m == 2) return mdays[1] + (is_leap_year(y) ? 1 : 0);
  return mdays[m - 1];
}

// Howard Hinnant's days_from_civil: days since 1970-01-01.
static int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= (m <= 2) ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int* y, unsigned* m, unsigned* d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t yy = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  *d = doy - (153 * mp + 2) / 5 + 1;
  *m = mp < 10 ? mp + 3 : mp - 9;
  *y = static_cast<int>(yy + (*m <= 2 ? 1 : 0));
}

// Parse an unsigned decimal of min_digits..max_digits digits starting at *pos.
static bool parse_digits(const std::string& s, size_t* pos, size_t min_digits, size_t max_digits,
                         int* out) {
  size_t i = *pos;
  int v = 0;
  size_t n = 0;
  while (i < s.size() && n < max_digits && s[i] >= '0' && s[i] <= '9') {
    v = v * 10 + (s[i] - '0');
    ++i;
    ++n;
  }
  if (n < min_digits) return false;
  // Reject e.g. "123" where only two digits are allowed.
  if (i < s.size() && s[i] >= '0' && s[i] <= '9') return false;
  *pos = i;
  *out = v;
  return true;
}

static bool expect_char(const std::string& s, size_t* pos, char c) {
  if (*pos >= s.size() || s[*pos] != c) return false;
  ++(*pos);
  return true;
}

} // namespace

bool civil_to_seconds(int year, int month, int day, int hour, int minute, int second,
                      CivilSeconds* out) {
  if (!out) return false;
  if (month < 1 || month > 12) return false;
  if (day < 1 || day > days_in_month(year, month)) return false;
  if (hour < 0 || hour > 23) return false;
  if (minute < 0 || minute > 59) return false;
  if (second < 0 || second > 59) return false;

  const int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  *out = days * 86400 + static_cast<int64_t>(hour) * 3600 + static_cast<int64_t>(minute) * 60 +
         static_cast<int64_t>(second);
  return true;
}

std::string format_civil_seconds(CivilSeconds t) {
  int64_t days = t / 86400;
  int64_t rem = t % 86400;
  if (rem < 0) {
    rem += 86400;
    --days;
  }
  int y = 0;
  unsigned m = 0;
  unsigned d = 0;
  civil_from_days(days, &y, &m, &d);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d", y, m, d,
                static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60),
                static_cast<int>(rem % 60));
  return std::string(buf);
}

bool parse_pressure_log_timestamp(const std::string& s_in, CivilSeconds* out) {
  if (!out) return false;
  const std::string s = trim(s_in);

  size_t i = 0;
  int mon = 0, day = 0, yy = 0, hh = 0, mm = 0, ss = 0;
  if (!parse_digits(s, &i, 1, 2, &mon) || !expect_char(s, &i, '/')) return false;
  if (!parse_digits(s, &i, 1, 2, &day) || !expect_char(s, &i, '/')) return false;
  if (!parse_digits(s, &i, 2, 2, &yy)) return false;

  if (i >= s.size() || s[i] != ' ') return false;
  while (i < s.size() && s[i] == ' ') ++i;

  if (!parse_digits(s, &i, 1, 2, &hh) || !expect_char(s, &i, ':')) return false;
  if (!parse_digits(s, &i, 1, 2, &mm) || !expect_char(s, &i, ':')) return false;
  if (!parse_digits(s, &i, 1, 2, &ss)) return false;

  // The gauge export sometimes omits the space before the meridiem.
  while (i < s.size() && s[i] == ' ') ++i;

  const std::string meridiem = to_lower(s.substr(i));
  if (meridiem != "am" && meridiem != "pm") return false;
  if (hh < 1 || hh > 12) return false;

  int hour24 = hh % 12;
  if (meridiem == "pm") hour24 += 12;

  const int year = (yy < 69) ? (2000 + yy) : (1900 + yy);
  return civil_to_seconds(year, mon, day, hour24, mm, ss, out);
}

bool parse_capture_timestamp(const std::string& file_name, CivilSeconds* out) {
  if (!out) return false;

  const std::string stem = trim(std::filesystem::u8path(file_name).stem().u8string());
  const size_t sp = stem.find_last_of(' ');
  const std::string token = (sp == std::string::npos) ? stem : stem.substr(sp + 1);

  // YYYY-MM-DD-HH-MM-SS
  if (token.size() != 19) return false;
  size_t i = 0;
  int y = 0, mon = 0, d = 0, hh = 0, mm = 0, ss = 0;
  if (!parse_digits(token, &i, 4, 4, &y) || !expect_char(token, &i, '-')) return false;
  if (!parse_digits(token, &i, 2, 2, &mon) || !expect_char(token, &i, '-')) return false;
  if (!parse_digits(token, &i, 2, 2, &d) || !expect_char(token, &i, '-')) return false;
  if (!parse_digits(token, &i, 2, 2, &hh) || !expect_char(token, &i, '-')) return false;
  if (!parse_digits(token, &i, 2, 2, &mm) || !expect_char(token, &i, '-')) return false;
  if (!parse_digits(token, &i, 2, 2, &ss)) return false;
  if (i != token.size()) return false;

  return civil_to_seconds(y, mon, d, hh, mm, ss, out);
}

} // namespace paschen
