#include "iatscore/results_table.hpp"

#include "iatscore/errors.hpp"
#include "iatscore/file_locator.hpp"
#include "iatscore/utils.hpp"

#include <iomanip>
#include <locale>
#include <sstream>

namespace iatscore {

namespace {

static const char* const kBlockFields[] = {
    "congruent_RT",
    "incongruent_RT",
    "dscore",
    "congruent_std",
    "incongruent_std",
    "congruent_NBerrors",
    "incongruent_NBerrors",
};

static std::string format_number(double v) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::setprecision(15) << v;
  return oss.str();
}

static void append_block(std::ostringstream* out, const std::optional<BlockSummary>& b) {
  if (!b) {
    for (size_t i = 0; i < 7; ++i) *out << ',';
    return;
  }
  *out << ',' << format_number(b->congruent_mean)
       << ',' << format_number(b->incongruent_mean)
       << ',' << format_number(b->dscore)
       << ',' << format_number(b->congruent_std)
       << ',' << format_number(b->incongruent_std)
       << ',' << b->congruent_errors
       << ',' << b->incongruent_errors;
}

} // namespace

std::string csv_escape(const std::string& s) {
  bool need_quotes = false;
  for (char c : s) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      need_quotes = true;
      break;
    }
  }
  if (!need_quotes) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::vector<std::string> ResultsTable::column_names() {
  std::vector<std::string> cols;
  cols.reserve(15);
  cols.push_back("participant_id");
  for (const char* block : {"block1_", "block2_"}) {
    for (const char* field : kBlockFields) {
      cols.push_back(std::string(block) + field);
    }
  }
  return cols;
}

void ResultsTable::add_participant(int participant) {
  auto it = rows_.find(participant);
  if (it != rows_.end()) return;
  ResultsRow row;
  row.participant_id = format_participant_id(participant);
  rows_.emplace(participant, std::move(row));
}

bool ResultsTable::set_block(int participant,
                             int block,
                             const BlockSummary& summary,
                             const std::string& source,
                             std::vector<std::string>* warnings) {
  if (block != 1 && block != 2) {
    if (warnings) {
      warnings->push_back("ignoring " + source + ": block number " + std::to_string(block) +
                          " is not 1 or 2 (participant " + format_participant_id(participant) + ")");
    }
    return false;
  }

  add_participant(participant);
  ResultsRow& row = rows_[participant];
  std::optional<BlockSummary>& slot = (block == 1) ? row.block1 : row.block2;
  if (slot && warnings) {
    warnings->push_back("block " + std::to_string(block) + " of participant " + row.participant_id +
                        " scored more than once; keeping " + source);
  }
  slot = summary;
  return true;
}

const ResultsRow* ResultsTable::find(int participant) const {
  auto it = rows_.find(participant);
  return (it == rows_.end()) ? nullptr : &it->second;
}

std::string ResultsTable::to_csv() const {
  std::ostringstream out;
  const std::vector<std::string> cols = column_names();
  for (size_t i = 0; i < cols.size(); ++i) {
    if (i) out << ',';
    out << cols[i];
  }
  out << '\n';

  for (const auto& kv : rows_) {
    out << csv_escape(kv.second.participant_id);
    append_block(&out, kv.second.block1);
    append_block(&out, kv.second.block2);
    out << '\n';
  }
  return out.str();
}

void ResultsTable::write_csv(const std::string& path) const {
  if (!write_text_file_atomic(path, to_csv())) {
    throw IoError("Failed to write results table: " + path);
  }
}

} // namespace iatscore
