#ifndef ERROR_H
#define ERROR_H

#include <string>

namespace colrec {
namespace error {

// Error is empty on success. A non-empty Error converts to true.
class Error {
 private:
  std::string msg_;
  bool err_;

 public:
  Error() : err_(false) {}
  Error(const char *msg) : msg_(msg), err_(true) {}
  Error(const std::string &msg) : msg_(msg), err_(true) {}

  operator bool() const { return err_; }

  const std::string &error() const { return msg_; }

  bool operator==(const Error &e) const {
    return err_ == e.err_ && msg_ == e.msg_;
  }
  bool operator!=(const Error &e) const { return !(*this == e); }
};

// wrap prepends context to err, "ctx: msg". An empty err stays empty.
Error wrap(const Error &err, const std::string &ctx);

}  // namespace error
}  // namespace colrec

#endif
