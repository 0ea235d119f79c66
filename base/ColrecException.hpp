#ifndef COLRECEXCEPTION_H
#define COLRECEXCEPTION_H

#include <exception>
#include <string>

namespace colrec {
namespace base {

// Thrown on broken internal invariants (e.g. an unsupported field type reaching
// the column copy path). Data errors are reported with error::Error instead.
class ColrecException : public std::exception {
 public:
  explicit ColrecException(const std::string &msg) : msg_(msg) {}
  explicit ColrecException(const char *msg) : msg_(msg) {}

  const char *what() const noexcept { return msg_.c_str(); }

 private:
  std::string msg_;
};

}  // namespace base
}  // namespace colrec

#endif
