#pragma once

#include "iatscore/scoring_config.hpp"
#include "iatscore/types.hpp"

#include <vector>

namespace iatscore {

// Read both response-time columns over the rows of `seg`.
//
// Throws MissingDataError (naming log.path) if a column is missing, the log is
// shorter than seg.last_row, or a required cell is empty/NA/non-numeric.
SegmentTrials extract_segment(const TrialLog& log, const TrialSegment& seg, const ScoringConfig& cfg);

// Second-chance correction.
//
// Each trial whose with-retry time differs from the keyboard-only time
// (exact comparison: both are raw logged values) gets retry_penalty_ms added
// and counts as one error.
CorrectedSegment correct_responses(const SegmentTrials& trials, double retry_penalty_ms);

// Clamp every value into [min_ms, max_ms].
void clip_response_times(std::vector<double>* rt, double min_ms, double max_ms);

// Mean and unbiased (n-1) standard deviation of rt after dropping the first
// exclude_leading values. Throws std::runtime_error if fewer than 2 values
// remain.
SegmentSummary summarize_segment(const std::vector<double>& rt, size_t exclude_leading);

// Full per-block scoring: extract, correct, clip and summarize both segments.
//
// Pure function of its inputs; no I/O.
BlockSummary score_block(const TrialLog& log, const ScoringConfig& cfg);

} // namespace iatscore
