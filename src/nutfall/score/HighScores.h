#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "nutfall/score/RunSummary.h"

namespace nutfall {

// Local best-runs table, highest score first.
class HighScoreTable {
 public:
  static constexpr std::size_t kMaxEntries = 20;

  // A missing file is an empty table, not an error.
  bool load(const std::string& path);
  [[nodiscard]] bool save(const std::string& path) const;

  // Returns the 0-based rank, or -1 when the run did not make the table.
  int add(RunSummary run);

  [[nodiscard]] const std::vector<RunSummary>& entries() const { return entries_; }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  void clear() { entries_.clear(); }

 private:
  std::vector<RunSummary> entries_;
};

}  // namespace nutfall
