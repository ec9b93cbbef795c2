#include "iatscore/trial_log_reader.hpp"

#include "iatscore/errors.hpp"
#include "iatscore/utils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace iatscore {

namespace {

size_t count_delim_outside_quotes(const std::string& s, char delim) {
  bool in_quotes = false;
  size_t n = 0;

  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') {
      if (in_quotes && (i + 1) < s.size() && s[i + 1] == '"') {
        // Escaped quote
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delim) ++n;
  }
  return n;
}

char detect_delim(const std::string& header_line) {
  // Comma is the default; some locales export with ';' or tabs.
  const size_t n_comma = count_delim_outside_quotes(header_line, ',');
  const size_t n_semi  = count_delim_outside_quotes(header_line, ';');
  const size_t n_tab   = count_delim_outside_quotes(header_line, '\t');

  char best = ',';
  size_t best_n = n_comma;
  if (n_semi > best_n) {
    best = ';';
    best_n = n_semi;
  }
  if (n_tab > best_n) {
    best = '\t';
  }
  return best;
}

bool is_preamble_line(const std::string& t) {
  if (t.empty()) return true;
  if (starts_with(t, "#")) return true;
  return false;
}

} // namespace

int TrialLog::column_index(const std::string& name) const {
  const std::string want = to_lower(trim(name));
  for (size_t i = 0; i < columns.size(); ++i) {
    if (to_lower(trim(columns[i])) == want) return static_cast<int>(i);
  }
  return -1;
}

TrialLog TrialLogReader::read(const std::string& path) const {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw IoError("Failed to open trial log: " + path);

  TrialLog log;
  log.path = path;

  char delim = ',';
  bool have_header = false;
  size_t lineno = 0;
  std::string line;

  while (std::getline(f, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!have_header) line = strip_utf8_bom(std::move(line));

    const std::string t = trim(line);

    // '#' lines are comments only before the header. Afterwards every
    // non-blank line is a trial row, since segments are addressed by row index.
    if (!have_header) {
      if (is_preamble_line(t)) continue;
      delim = detect_delim(t);
      try {
        log.columns = split_csv_row(t, delim);
      } catch (const std::runtime_error& e) {
        throw MissingDataError(path, "header: " + std::string(e.what()));
      }
      for (auto& c : log.columns) c = trim(c);
      have_header = true;
      continue;
    }
    if (t.empty()) continue;

    std::vector<std::string> vals;
    try {
      vals = split_csv_row(line, delim);
    } catch (const std::runtime_error& e) {
      throw MissingDataError(path, "line " + std::to_string(lineno) + ": " + e.what());
    }

    // Exporters sometimes omit trailing empty cells or append extra delimiters.
    if (vals.size() < log.columns.size()) {
      vals.resize(log.columns.size());
    } else if (vals.size() > log.columns.size()) {
      while (vals.size() > log.columns.size() && trim(vals.back()).empty()) {
        vals.pop_back();
      }
    }

    if (vals.size() != log.columns.size()) {
      throw MissingDataError(path, "column count mismatch at line " + std::to_string(lineno) +
                                       " (expected " + std::to_string(log.columns.size()) +
                                       ", got " + std::to_string(vals.size()) + ")");
    }

    log.rows.push_back(std::move(vals));
  }

  if (f.bad()) throw IoError("Failed while reading trial log: " + path);
  if (!have_header) throw MissingDataError(path, "missing header row");

  return log;
}

} // namespace iatscore
