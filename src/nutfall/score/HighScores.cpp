#include "nutfall/score/HighScores.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <utility>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace nutfall {

namespace {

void sortAndTrim(std::vector<RunSummary>& entries) {
  std::ranges::stable_sort(entries, std::ranges::greater{}, &RunSummary::score);
  if (entries.size() > HighScoreTable::kMaxEntries)
    entries.resize(HighScoreTable::kMaxEntries);
}

}  // namespace

bool HighScoreTable::load(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    entries_.clear();
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    std::printf("HighScoreTable: parse error in %s: %s\n", path.c_str(), err.what());
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path.c_str(), "root", {"version", "scores"});

  std::vector<RunSummary> next;
  if (const toml::array* scores = tbl["scores"].as_array()) {
    for (const toml::node& node : *scores) {
      const toml::table* entry = node.as_table();
      if (!entry) {
        TomlUtil::warnf(path.c_str(), "scores entries must be tables");
        continue;
      }
      RunSummary run;
      if (run.loadFromToml(*entry, path.c_str()))
        next.push_back(std::move(run));
    }
  }

  sortAndTrim(next);
  entries_ = std::move(next);
  return true;
}

bool HighScoreTable::save(const std::string& path) const {
  if (path.empty())
    return false;

  toml::array scores;
  for (const RunSummary& run : entries_) {
    scores.push_back(run.toToml());
  }

  toml::table tbl;
  tbl.insert("version", 1);
  tbl.insert("scores", std::move(scores));
  return TomlUtil::writeTableAtomically(tbl, path);
}

int HighScoreTable::add(RunSummary run) {
  // Ties keep the earlier run ahead.
  auto it = std::ranges::upper_bound(entries_, run.score, std::ranges::greater{},
                                     &RunSummary::score);
  const auto rank = static_cast<std::size_t>(it - entries_.begin());
  if (rank >= kMaxEntries)
    return -1;

  entries_.insert(it, std::move(run));
  if (entries_.size() > kMaxEntries)
    entries_.resize(kMaxEntries);
  return static_cast<int>(rank);
}

}  // namespace nutfall
