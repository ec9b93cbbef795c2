#pragma once

#include "iatscore/types.hpp"

#include <cstddef>
#include <string>

namespace iatscore {

// Constants of the IAT scoring algorithm.
//
// Defaults follow O'Donnell et al. (2020) and Chassard (2006): a 600 ms
// second-chance penalty, response times clipped to [300, 3000] ms, and the
// first trial of each segment discarded as warm-up.
struct ScoringConfig {
  double retry_penalty_ms{600.0};
  double clip_min_ms{300.0};
  double clip_max_ms{3000.0};
  size_t exclude_leading_trials{1};

  TrialSegment congruent{"congruent", 51, 90};
  TrialSegment incongruent{"incongruent", 121, 160};

  // Response time including the second-chance attempt.
  std::string rt_column{"response_time"};
  // Response time of the keyboard response item alone (no retry).
  std::string rt_keyboard_column{"response_time_keyboard_response"};
};

// How trial-log files are found and how participant/block numbers are read
// from their names.
struct LocatorOptions {
  std::string file_pattern{"*.csv"};

  // ECMAScript regexes; the first capture group holds the number.
  std::string participant_pattern{"P(\\d{2})"};
  std::string block_pattern{"block(\\d+)"};
  // Applies to both regexes. Set to false for lowercase "p05" names; the
  // file_pattern filter always ignores case.
  bool case_sensitive{true};

  // When block_pattern does not match, read the character this many positions
  // from the end of the filename (5 => the '1' in "..._1.csv"). 0 disables the
  // fallback.
  size_t block_fallback_offset{5};

  // Record per-file filename errors instead of throwing.
  bool collect_errors{false};
};

struct RunConfig {
  ScoringConfig scoring;
  LocatorOptions locator;
  std::string output_name{"opensesameResults.csv"};
  bool keep_going{false};
};

// Parse "51-90" into a segment. Throws std::runtime_error on malformed input.
TrialSegment parse_trial_segment(const std::string& name, const std::string& range);

// Apply one "key = value" setting. Unknown keys throw std::runtime_error.
void apply_config_value(RunConfig* cfg, const std::string& key, const std::string& value);

// Load settings from a file of "key = value" lines ('#' starts a comment) on
// top of the values already in *cfg.
void load_run_config_file(const std::string& path, RunConfig* cfg);

// Throws std::runtime_error describing the first invalid setting.
void validate_scoring_config(const ScoringConfig& cfg);
void validate_run_config(const RunConfig& cfg);

} // namespace iatscore
