#pragma once

#include "iatscore/results_table.hpp"
#include "iatscore/scoring_config.hpp"

#include <string>
#include <vector>

namespace iatscore {

struct PipelineResult {
  ResultsTable table;

  size_t n_files_found{0};
  size_t n_blocks_scored{0};

  // Visible notes about data that was skipped or guessed.
  std::vector<std::string> warnings;

  // Per-file failures recorded in keep-going mode.
  std::vector<std::string> errors;
};

// Score every trial log under input_root.
//
// Error policy:
// - default (cfg.keep_going == false): the first FilenamePatternError,
//   MissingDataError or IoError propagates and no result is returned.
// - keep-going: per-file errors are appended to PipelineResult::errors and the
//   affected blocks stay empty; every discovered participant still has a row.
//
// Configuration problems always throw std::runtime_error.
PipelineResult run_pipeline(const std::string& input_root, const RunConfig& cfg);

// Human-readable summary of a run (counts, warnings, errors).
std::string format_run_report(const std::string& input_root, const PipelineResult& result);

} // namespace iatscore
