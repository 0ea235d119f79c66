#ifndef LOGGING_H
#define LOGGING_H

#include <sstream>

#include <boost/noncopyable.hpp>

namespace colrec {
namespace base {

// One Logger object per log statement; the line is emitted on destruction.
class Logger : boost::noncopyable {
 public:
  enum LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    NUM_LOG_LEVELS,
  };

  typedef void (*OutputFunc)(const char *msg, int len);

  Logger(const char *file, int line, LogLevel level);
  ~Logger();

  std::ostringstream &stream() { return stream_; }

  static LogLevel log_level();
  static void set_log_level(LogLevel level);

  // Default output writes to stderr.
  static void set_output(OutputFunc out);

 private:
  std::ostringstream stream_;
};

const char *log_level_name(Logger::LogLevel level);

}  // namespace base
}  // namespace colrec

#define LOG_TRACE                                                     \
  if (colrec::base::Logger::log_level() <= colrec::base::Logger::TRACE) \
  colrec::base::Logger(__FILE__, __LINE__, colrec::base::Logger::TRACE).stream()
#define LOG_DEBUG                                                     \
  if (colrec::base::Logger::log_level() <= colrec::base::Logger::DEBUG) \
  colrec::base::Logger(__FILE__, __LINE__, colrec::base::Logger::DEBUG).stream()
#define LOG_INFO                                                     \
  if (colrec::base::Logger::log_level() <= colrec::base::Logger::INFO) \
  colrec::base::Logger(__FILE__, __LINE__, colrec::base::Logger::INFO).stream()
#define LOG_WARN \
  colrec::base::Logger(__FILE__, __LINE__, colrec::base::Logger::WARN).stream()
#define LOG_ERROR \
  colrec::base::Logger(__FILE__, __LINE__, colrec::base::Logger::ERROR).stream()

#endif
