#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace iatscore {

// One parsed trial-log file (one participant, one block).
//
// Rows are the data rows following the header. Row indices used by the
// scoring code are 1-based: rows[0] is row 1.
struct TrialLog {
  std::string path;
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;

  size_t n_rows() const { return rows.size(); }

  // Index of a column (trimmed, case-insensitive match), or -1.
  int column_index(const std::string& name) const;
};

// A 1-based, inclusive range of trial rows, e.g. congruent trials 51-90.
struct TrialSegment {
  std::string name;
  size_t first_row{0};
  size_t last_row{0};

  size_t length() const { return (last_row >= first_row && first_row > 0) ? (last_row - first_row + 1) : 0; }
};

// Raw response times of one segment, in row order.
struct SegmentTrials {
  std::vector<double> rt_with_retry;
  std::vector<double> rt_keyboard;
};

// Response times after second-chance correction (and, once clipped, bounded).
struct CorrectedSegment {
  std::vector<double> rt;
  int n_errors{0};
};

struct SegmentSummary {
  double mean{0.0};
  double stddev{0.0};
  size_t n_trials{0};
};

// Scores of one participant block.
//
// dscore is always congruent_mean - incongruent_mean.
struct BlockSummary {
  double congruent_mean{0.0};
  double incongruent_mean{0.0};
  double dscore{0.0};
  double congruent_std{0.0};
  double incongruent_std{0.0};
  int congruent_errors{0};
  int incongruent_errors{0};
};

} // namespace iatscore
