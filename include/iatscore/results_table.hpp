#pragma once

#include "iatscore/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace iatscore {

struct ResultsRow {
  std::string participant_id;
  std::optional<BlockSummary> block1;
  std::optional<BlockSummary> block2;
};

// Escape a string for inclusion in a CSV cell.
// Quotes are doubled; the cell is quoted if it contains a comma, quote or newline.
std::string csv_escape(const std::string& s);

// Wide results table: one row per participant, block 1 and block 2 summaries
// side by side. Owned by a single pipeline run.
class ResultsTable {
public:
  // The 15 output column names, participant_id first.
  static std::vector<std::string> column_names();

  // Ensure a (possibly empty) row exists for this participant.
  void add_participant(int participant);

  // Store a block summary into the participant's block 1 or block 2 columns.
  //
  // Returns false and leaves the table untouched if block is not 1 or 2. A
  // warning is appended to *warnings (if given) in that case, and when an
  // already filled block is overwritten.
  bool set_block(int participant,
                 int block,
                 const BlockSummary& summary,
                 const std::string& source,
                 std::vector<std::string>* warnings = nullptr);

  const ResultsRow* find(int participant) const;
  size_t size() const { return rows_.size(); }
  bool empty() const { return rows_.empty(); }

  // CSV text: header plus one line per participant in ascending participant
  // number. Blocks that were not scored are written as empty cells.
  std::string to_csv() const;

  // Atomically write to_csv() to path. Throws IoError on failure.
  void write_csv(const std::string& path) const;

private:
  std::map<int, ResultsRow> rows_;
};

} // namespace iatscore
