#include "base/Logging.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>

#include <atomic>

namespace colrec {
namespace base {

namespace {

Logger::LogLevel init_log_level() {
  if (::getenv("COLREC_LOG_TRACE"))
    return Logger::TRACE;
  else if (::getenv("COLREC_LOG_DEBUG"))
    return Logger::DEBUG;
  else
    return Logger::INFO;
}

void default_output(const char *msg, int len) {
  size_t n = fwrite(msg, 1, len, stderr);
  (void)n;
}

std::atomic<int> g_log_level(init_log_level());
std::atomic<Logger::OutputFunc> g_output(&default_output);

const char *basename_of(const char *file) {
  const char *slash = strrchr(file, '/');
  return slash ? slash + 1 : file;
}

}  // namespace

const char *log_level_name(Logger::LogLevel level) {
  switch (level) {
    case Logger::TRACE:
      return "TRACE";
    case Logger::DEBUG:
      return "DEBUG";
    case Logger::INFO:
      return "INFO ";
    case Logger::WARN:
      return "WARN ";
    case Logger::ERROR:
      return "ERROR";
    default:
      return "?????";
  }
}

Logger::Logger(const char *file, int line, LogLevel level) {
  struct timeval tv;
  gettimeofday(&tv, nullptr);
  struct tm tm_time;
  localtime_r(&tv.tv_sec, &tm_time);
  char buf[64];
  snprintf(buf, sizeof(buf), "%4d%02d%02d %02d:%02d:%02d.%06d ",
           tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
           tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec,
           static_cast<int>(tv.tv_usec));
  stream_ << buf << log_level_name(level) << " " << basename_of(file) << ":"
          << line << " ";
}

Logger::~Logger() {
  stream_ << '\n';
  std::string line = stream_.str();
  g_output.load()(line.data(), static_cast<int>(line.size()));
}

Logger::LogLevel Logger::log_level() {
  return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

void Logger::set_log_level(LogLevel level) {
  g_log_level.store(level, std::memory_order_relaxed);
}

void Logger::set_output(OutputFunc out) {
  g_output.store(out ? out : &default_output);
}

}  // namespace base
}  // namespace colrec
