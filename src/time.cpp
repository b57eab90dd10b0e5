#include "lfsync/time.hpp"

#include <cstdio>

#if defined(_WIN32)
#include <time.h>
#include <windows.h>
static std::time_t timegm_portable(std::tm *t) { return _mkgmtime(t); }
static void gmtime_portable(std::time_t t, std::tm *out) { gmtime_s(out, &t); }
#else
// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }
static void gmtime_portable(std::time_t t, std::tm *out) { gmtime_r(&t, out); }
#endif

namespace lfsync::timeutil {

std::string iso8601_utc(std::time_t when) {
  std::tm gt{};
  gmtime_portable(when, &gt);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", gt.tm_year + 1900,
                gt.tm_mon + 1, gt.tm_mday, gt.tm_hour, gt.tm_min, gt.tm_sec);
  return std::string(buf);
}

std::optional<std::time_t> parse_iso8601_utc(std::string_view text) {
  // Only the fixed-width date/time prefix matters; fractions and zone suffix
  // are always UTC in documents this program writes.
  if (text.size() < 19)
    return std::nullopt;
  const std::string head(text.substr(0, 19));
  std::tm t{};
  char sep = 0;
  const int n = std::sscanf(head.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d", &t.tm_year, &t.tm_mon,
                            &t.tm_mday, &sep, &t.tm_hour, &t.tm_min, &t.tm_sec);
  if (n != 7 || (sep != 'T' && sep != ' '))
    return std::nullopt;
  t.tm_year -= 1900;
  t.tm_mon -= 1;
  return timegm_portable(&t);
}

} // namespace lfsync::timeutil
