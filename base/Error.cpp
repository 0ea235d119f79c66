#include "base/Error.hpp"

namespace colrec {
namespace error {

Error wrap(const Error &err, const std::string &ctx) {
  if (!err) return err;
  return Error(ctx + ": " + err.error());
}

}  // namespace error
}  // namespace colrec
