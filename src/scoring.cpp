#include "iatscore/scoring.hpp"

#include "iatscore/errors.hpp"
#include "iatscore/utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace iatscore {

namespace {

bool is_nan_like(const std::string& t) {
  const std::string low = to_lower(trim(t));
  return low == "nan" || low == "na" || low == "n/a" || low == "none" || low == "null";
}

double parse_rt_cell(const TrialLog& log, size_t row, const std::string& column, const std::string& cell) {
  const std::string t = trim(cell);
  const std::string where = "row " + std::to_string(row) + ", column '" + column + "'";
  if (t.empty() || is_nan_like(t)) {
    throw MissingDataError(log.path, "no response time at " + where + (t.empty() ? "" : " ('" + t + "')"));
  }

  double v = 0.0;
  try {
    v = to_double(t);
  } catch (const std::exception&) {
    throw MissingDataError(log.path, "non-numeric response time '" + t + "' at " + where);
  }
  if (!std::isfinite(v)) {
    throw MissingDataError(log.path, "non-finite response time '" + t + "' at " + where);
  }
  return v;
}

} // namespace

SegmentTrials extract_segment(const TrialLog& log, const TrialSegment& seg, const ScoringConfig& cfg) {
  if (seg.length() == 0) {
    throw std::runtime_error("extract_segment: invalid " + seg.name + " segment");
  }

  const int col_retry = log.column_index(cfg.rt_column);
  const int col_keyboard = log.column_index(cfg.rt_keyboard_column);
  if (col_retry < 0) {
    throw MissingDataError(log.path, "missing column '" + cfg.rt_column + "'");
  }
  if (col_keyboard < 0) {
    throw MissingDataError(log.path, "missing column '" + cfg.rt_keyboard_column + "'");
  }

  if (log.n_rows() < seg.last_row) {
    throw MissingDataError(log.path, seg.name + " trials need rows " + std::to_string(seg.first_row) + "-" +
                                         std::to_string(seg.last_row) + ", found " +
                                         std::to_string(log.n_rows()) + " data rows");
  }

  SegmentTrials out;
  out.rt_with_retry.reserve(seg.length());
  out.rt_keyboard.reserve(seg.length());

  for (size_t row = seg.first_row; row <= seg.last_row; ++row) {
    const auto& cells = log.rows[row - 1];
    const auto cell = [&cells](int col) -> std::string {
      const size_t i = static_cast<size_t>(col);
      return i < cells.size() ? cells[i] : std::string();
    };
    out.rt_with_retry.push_back(parse_rt_cell(log, row, cfg.rt_column, cell(col_retry)));
    out.rt_keyboard.push_back(parse_rt_cell(log, row, cfg.rt_keyboard_column, cell(col_keyboard)));
  }
  return out;
}

CorrectedSegment correct_responses(const SegmentTrials& trials, double retry_penalty_ms) {
  if (trials.rt_with_retry.size() != trials.rt_keyboard.size()) {
    throw std::runtime_error("correct_responses: response time sequences differ in length");
  }

  CorrectedSegment out;
  out.rt = trials.rt_with_retry;
  for (size_t i = 0; i < out.rt.size(); ++i) {
    if (trials.rt_with_retry[i] != trials.rt_keyboard[i]) {
      out.rt[i] += retry_penalty_ms;
      ++out.n_errors;
    }
  }
  return out;
}

void clip_response_times(std::vector<double>* rt, double min_ms, double max_ms) {
  if (!rt) return;
  for (double& x : *rt) {
    x = std::max(std::min(x, max_ms), min_ms);
  }
}

SegmentSummary summarize_segment(const std::vector<double>& rt, size_t exclude_leading) {
  if (rt.size() < exclude_leading + 2) {
    throw std::runtime_error("summarize_segment: need at least 2 trials after excluding " +
                             std::to_string(exclude_leading) + " (have " + std::to_string(rt.size()) + ")");
  }

  const size_t n = rt.size() - exclude_leading;

  double sum = 0.0;
  for (size_t i = exclude_leading; i < rt.size(); ++i) sum += rt[i];
  const double mean = sum / static_cast<double>(n);

  double acc = 0.0;
  for (size_t i = exclude_leading; i < rt.size(); ++i) {
    const double d = rt[i] - mean;
    acc += d * d;
  }
  const double var = acc / static_cast<double>(n - 1);

  SegmentSummary s;
  s.mean = mean;
  s.stddev = std::sqrt(std::max(0.0, var));
  s.n_trials = n;
  return s;
}

BlockSummary score_block(const TrialLog& log, const ScoringConfig& cfg) {
  CorrectedSegment con = correct_responses(extract_segment(log, cfg.congruent, cfg), cfg.retry_penalty_ms);
  CorrectedSegment inc = correct_responses(extract_segment(log, cfg.incongruent, cfg), cfg.retry_penalty_ms);

  clip_response_times(&con.rt, cfg.clip_min_ms, cfg.clip_max_ms);
  clip_response_times(&inc.rt, cfg.clip_min_ms, cfg.clip_max_ms);

  const SegmentSummary con_s = summarize_segment(con.rt, cfg.exclude_leading_trials);
  const SegmentSummary inc_s = summarize_segment(inc.rt, cfg.exclude_leading_trials);

  BlockSummary b;
  b.congruent_mean = con_s.mean;
  b.incongruent_mean = inc_s.mean;
  b.dscore = con_s.mean - inc_s.mean;
  b.congruent_std = con_s.stddev;
  b.incongruent_std = inc_s.stddev;
  b.congruent_errors = con.n_errors;
  b.incongruent_errors = inc.n_errors;
  return b;
}

} // namespace iatscore
