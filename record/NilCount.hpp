#ifndef NILCOUNT_H
#define NILCOUNT_H

#include <vector>

namespace colrec {
namespace record {

// NilCount is the prefix sum of nulls of one column:
// value[j] is the number of null rows in [0, j).
// Logical row r lives at physical element r - value[r].
class NilCount {
 public:
  std::vector<int> value;
  int total;

  NilCount() : total(0) {}

  // Leaves value untouched when total == 0, callers then skip the
  // translation. Otherwise value has size elements and value[0] == 0; the
  // caller fills value[1, size). Storage is reused and never shrunk.
  void init(int total_, int size) {
    total = total_;
    if (total == 0) return;

    value.resize(size);
    value[0] = 0;
  }
};

}  // namespace record
}  // namespace colrec

#endif
