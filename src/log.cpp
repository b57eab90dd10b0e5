#include "lfsync/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace lfsync {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::INFO};
char g_log_tag[32] = "lfsync";
std::mutex g_log_mutex; // workers log concurrently

void log_write(LogLevel level, const char *fmt, va_list args) {
  if (level < g_log_level.load())
    return;

  char level_ch = '?';
  switch (level) {
  case LogLevel::DEBUG:
    level_ch = 'D';
    break;
  case LogLevel::INFO:
    level_ch = 'I';
    break;
  case LogLevel::WARN:
    level_ch = 'W';
    break;
  case LogLevel::ERROR:
    level_ch = 'E';
    break;
  case LogLevel::OFF:
    return;
  }

  char msg[2048];
  std::vsnprintf(msg, sizeof(msg), fmt, args);

  const std::time_t now = std::time(nullptr);
  std::tm tm_info{};
  gmtime_r(&now, &tm_info);
  char time_buf[32];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_info);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::fprintf(stderr, "%s %c/%s: %s\n", time_buf, level_ch, g_log_tag, msg);
  std::fflush(stderr);
}

} // namespace

void log_init(const char *tag) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  std::strncpy(g_log_tag, tag, sizeof(g_log_tag) - 1);
  g_log_tag[sizeof(g_log_tag) - 1] = '\0';
}

void log_set_level(LogLevel level) { g_log_level.store(level); }

auto log_level() -> LogLevel { return g_log_level.load(); }

auto parse_log_level(std::string_view name) -> LogLevel {
  if (name == "debug")
    return LogLevel::DEBUG;
  if (name == "warn" || name == "warning")
    return LogLevel::WARN;
  if (name == "error")
    return LogLevel::ERROR;
  if (name == "off")
    return LogLevel::OFF;
  return LogLevel::INFO;
}

void log_d(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_write(LogLevel::DEBUG, fmt, args);
  va_end(args);
}

void log_i(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_write(LogLevel::INFO, fmt, args);
  va_end(args);
}

void log_w(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_write(LogLevel::WARN, fmt, args);
  va_end(args);
}

void log_e(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_write(LogLevel::ERROR, fmt, args);
  va_end(args);
}

auto mask_token(std::string_view text) -> std::string {
  std::string out(text);
  std::size_t from = 0;
  while (true) {
    const auto scheme = out.find("://", from);
    if (scheme == std::string::npos)
      break;
    const auto auth_begin = scheme + 3;
    const auto at = out.find('@', auth_begin);
    const auto slash = out.find('/', auth_begin);
    if (at == std::string::npos || (slash != std::string::npos && slash < at)) {
      from = auth_begin;
      continue;
    }
    const auto colon = out.find(':', auth_begin);
    if (colon != std::string::npos && colon < at) {
      out.replace(colon + 1, at - colon - 1, "***");
      from = colon + 4;
    } else {
      from = at + 1;
    }
  }
  return out;
}

} // namespace lfsync
