#pragma once

#include "iatscore/scoring_config.hpp"

#include <map>
#include <string>
#include <vector>

namespace iatscore {

// One trial-log file with the identity decoded from its filename.
struct TrialLogFile {
  std::string path;
  int participant{0};
  int block{0};
  // True if the block number came from the positional fallback.
  bool block_from_fallback{false};
};

struct LocatedTrialLogs {
  // Ascending participant number -> files (sorted by path).
  std::map<int, std::vector<TrialLogFile>> by_participant;

  // Matching files without a participant code (excluded from scoring).
  std::vector<std::string> unmatched;

  // Non-fatal notes, e.g. block numbers taken from the positional fallback.
  std::vector<std::string> warnings;

  // Filename errors, only filled when LocatorOptions::collect_errors is set.
  // The participant of such a file still gets a (possibly empty) entry.
  std::vector<std::string> errors;

  size_t n_files() const;
};

// "p05" for participant 5.
std::string format_participant_id(int participant);

// Participant number from a filename (not a path), or -1 if absent. Throws
// FilenamePatternError if the capture is not a number that fits an int.
int parse_participant_number(const std::string& filename, const LocatorOptions& opt);

// Block number from a filename (not a path).
//
// Resolution order:
//  1) block_pattern; all matches must agree on the same number.
//  2) the character block_fallback_offset positions from the end, which must
//     be a digit (*used_fallback is set).
// Throws FilenamePatternError (with `path` for context) if neither yields a
// number, or if the pattern matches conflicting numbers.
int resolve_block_number(const std::string& path,
                         const std::string& filename,
                         const LocatorOptions& opt,
                         bool* used_fallback = nullptr);

// Recursively scan `root` for trial logs.
//
// Throws IoError if root is not a directory, and FilenamePatternError for an
// unresolvable block number unless opt.collect_errors is set.
LocatedTrialLogs locate_trial_logs(const std::string& root, const LocatorOptions& opt);

} // namespace iatscore
