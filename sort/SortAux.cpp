#include "sort/SortAux.hpp"

#include <algorithm>

namespace colrec {
namespace sort {

void SortAux::init(const std::vector<int64_t> &t) {
  size_t size = t.size();
  times.assign(t.begin(), t.end());
  row_ids.resize(size);
  for (size_t i = 0; i < size; ++i) row_ids[i] = static_cast<int32_t>(i);
}

void SortAux::sort() {
  // times is still indexed by original row here.
  const std::vector<int64_t> &t = times;
  std::stable_sort(row_ids.begin(), row_ids.end(),
                   [&t](int32_t a, int32_t b) { return t[a] < t[b]; });

  sorted_times_.resize(row_ids.size());
  for (size_t i = 0; i < row_ids.size(); ++i)
    sorted_times_[i] = times[row_ids[i]];
  times.swap(sorted_times_);
}

void SortAux::init_sections() {
  sections_.clear();
  if (row_ids.empty()) return;

  int start = 0;
  for (int i = 0; i < len() - 1; ++i) {
    if (row_ids[i + 1] - row_ids[i] != 1 || times[i] == times[i + 1]) {
      sections_.push_back(start);
      sections_.push_back(i);
      start = i + 1;
    }
  }
  sections_.push_back(start);
  sections_.push_back(len() - 1);
}

std::tuple<int, int, int> SortAux::row_index(int i) const {
  int start = sections_[2 * i], end = sections_[2 * i + 1];
  return std::make_tuple(start, static_cast<int>(row_ids[start]),
                         static_cast<int>(row_ids[end]) + 1);
}

}  // namespace sort
}  // namespace colrec
