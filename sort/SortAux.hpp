#ifndef SORTAUX_H
#define SORTAUX_H

#include <stdint.h>

#include <tuple>
#include <vector>

namespace colrec {
namespace sort {

// SortAux is the permutation that orders the rows of a record by time.
// row_ids[i] is the original row at sort position i, times[i] its timestamp.
class SortAux {
 public:
  std::vector<int32_t> row_ids;
  std::vector<int64_t> times;

  // Identity permutation over t.
  void init(const std::vector<int64_t> &t);

  // Stable sort by time, rows with equal time keep their arrival order.
  // Must follow init().
  void sort();

  // Splits the sorted positions into sections: maximal runs whose original
  // rows are consecutive and whose timestamps are all distinct. A section can
  // be copied from the source column with one bulk append.
  void init_sections();

  int len() const { return static_cast<int>(row_ids.size()); }

  int section_len() const { return static_cast<int>(sections_.size() / 2); }

  // Flattened (first, last) sort positions, both inclusive.
  const std::vector<int> &sections() const { return sections_; }

  // <sort position of the first row, first original row, original row end>
  // of section i, the row range is half-open.
  std::tuple<int, int, int> row_index(int i) const;

 private:
  std::vector<int> sections_;
  std::vector<int64_t> sorted_times_;
};

}  // namespace sort
}  // namespace colrec

#endif
