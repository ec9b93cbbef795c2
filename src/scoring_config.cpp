#include "iatscore/scoring_config.hpp"

#include "iatscore/errors.hpp"
#include "iatscore/pattern.hpp"
#include "iatscore/utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace iatscore {

namespace {

static bool is_comment_or_empty_line(const std::string& s) {
  const std::string t = trim(s);
  return t.empty() || t[0] == '#';
}

static std::string strip_quotes(const std::string& s) {
  std::string t = trim(s);
  if (t.size() >= 2 && ((t.front() == '"' && t.back() == '"') || (t.front() == '\'' && t.back() == '\''))) {
    t = t.substr(1, t.size() - 2);
  }
  return trim(t);
}

static bool parse_bool_value(const std::string& key, const std::string& s) {
  const std::string t = to_lower(trim(s));
  if (t == "1" || t == "true" || t == "yes" || t == "on") return true;
  if (t == "0" || t == "false" || t == "no" || t == "off") return false;
  throw std::runtime_error("Config: invalid boolean for " + key + ": '" + s + "'");
}

static size_t parse_count(const std::string& key, const std::string& s) {
  const int v = to_int(s);
  if (v < 0) throw std::runtime_error("Config: " + key + " must be >= 0 (got " + trim(s) + ")");
  return static_cast<size_t>(v);
}

static double parse_ms(const std::string& key, const std::string& s) {
  const double v = to_double(s);
  if (!std::isfinite(v)) throw std::runtime_error("Config: " + key + " must be finite");
  return v;
}

static void validate_segment(const TrialSegment& seg, size_t exclude_leading) {
  if (seg.first_row < 1 || seg.last_row < seg.first_row) {
    throw std::runtime_error("Config: invalid " + seg.name + " rows " +
                             std::to_string(seg.first_row) + "-" + std::to_string(seg.last_row));
  }
  // The summary needs at least two trials left for a sample standard deviation.
  if (seg.length() < exclude_leading + 2) {
    throw std::runtime_error("Config: " + seg.name + " segment has " + std::to_string(seg.length()) +
                             " trials, too few after excluding " + std::to_string(exclude_leading));
  }
}

static void validate_capture_pattern(const std::string& key, const std::string& pattern, bool case_sensitive) {
  if (trim(pattern).empty()) throw std::runtime_error("Config: " + key + " must not be empty");
  const std::regex re = compile_regex(pattern, case_sensitive);
  if (re.mark_count() < 1) {
    throw std::runtime_error("Config: " + key + " needs a capture group around the number: '" + pattern + "'");
  }
}

} // namespace

TrialSegment parse_trial_segment(const std::string& name, const std::string& range) {
  const std::string t = trim(range);
  size_t sep = t.find('-');
  if (sep == std::string::npos) sep = t.find(':');
  if (sep == std::string::npos || sep == 0 || sep + 1 >= t.size()) {
    throw std::runtime_error("Config: " + name + " rows must look like FIRST-LAST (got '" + range + "')");
  }

  const int first = to_int(t.substr(0, sep));
  const int last = to_int(t.substr(sep + 1));
  if (first < 1 || last < first) {
    throw std::runtime_error("Config: " + name + " rows must satisfy 1 <= FIRST <= LAST (got '" + range + "')");
  }

  TrialSegment seg;
  seg.name = name;
  seg.first_row = static_cast<size_t>(first);
  seg.last_row = static_cast<size_t>(last);
  return seg;
}

void apply_config_value(RunConfig* cfg, const std::string& key_in, const std::string& value_in) {
  if (!cfg) throw std::runtime_error("apply_config_value: null config");
  const std::string key = to_lower(trim(key_in));
  const std::string value = strip_quotes(value_in);

  ScoringConfig& s = cfg->scoring;
  LocatorOptions& l = cfg->locator;

  if (key == "retry_penalty_ms") {
    s.retry_penalty_ms = parse_ms(key, value);
  } else if (key == "clip_min_ms") {
    s.clip_min_ms = parse_ms(key, value);
  } else if (key == "clip_max_ms") {
    s.clip_max_ms = parse_ms(key, value);
  } else if (key == "exclude_leading_trials") {
    s.exclude_leading_trials = parse_count(key, value);
  } else if (key == "congruent_rows") {
    s.congruent = parse_trial_segment("congruent", value);
  } else if (key == "incongruent_rows") {
    s.incongruent = parse_trial_segment("incongruent", value);
  } else if (key == "rt_column") {
    s.rt_column = value;
  } else if (key == "rt_keyboard_column") {
    s.rt_keyboard_column = value;
  } else if (key == "file_pattern") {
    l.file_pattern = value;
  } else if (key == "participant_pattern") {
    l.participant_pattern = value;
  } else if (key == "block_pattern") {
    l.block_pattern = value;
  } else if (key == "case_sensitive") {
    l.case_sensitive = parse_bool_value(key, value);
  } else if (key == "block_fallback_offset") {
    l.block_fallback_offset = parse_count(key, value);
  } else if (key == "output_name") {
    cfg->output_name = value;
  } else if (key == "keep_going") {
    cfg->keep_going = parse_bool_value(key, value);
  } else {
    throw std::runtime_error("Config: unknown key '" + trim(key_in) + "'");
  }
}

void load_run_config_file(const std::string& path, RunConfig* cfg) {
  if (!cfg) throw std::runtime_error("load_run_config_file: null config");

  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw IoError("Failed to open config file: " + path);

  std::string line;
  size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;
    if (lineno == 1) line = strip_utf8_bom(std::move(line));
    if (is_comment_or_empty_line(line)) continue;

    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error("Config: expected key = value at " + path + ":" + std::to_string(lineno));
    }

    // Allow trailing comments after the value: key = 600  # ms
    std::string value = line.substr(eq + 1);
    const size_t hash = value.find(" #");
    if (hash != std::string::npos) value = value.substr(0, hash);

    try {
      apply_config_value(cfg, line.substr(0, eq), value);
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string(e.what()) + " (" + path + ":" + std::to_string(lineno) + ")");
    }
  }
}

void validate_scoring_config(const ScoringConfig& cfg) {
  if (!(cfg.clip_min_ms <= cfg.clip_max_ms)) {
    throw std::runtime_error("Config: clip_min_ms must be <= clip_max_ms");
  }
  if (trim(cfg.rt_column).empty() || trim(cfg.rt_keyboard_column).empty()) {
    throw std::runtime_error("Config: response time column names must not be empty");
  }
  validate_segment(cfg.congruent, cfg.exclude_leading_trials);
  validate_segment(cfg.incongruent, cfg.exclude_leading_trials);
}

void validate_run_config(const RunConfig& cfg) {
  validate_scoring_config(cfg.scoring);

  const LocatorOptions& l = cfg.locator;
  if (trim(l.file_pattern).empty()) throw std::runtime_error("Config: file_pattern must not be empty");
  validate_capture_pattern("participant_pattern", l.participant_pattern, l.case_sensitive);
  validate_capture_pattern("block_pattern", l.block_pattern, l.case_sensitive);

  const std::string name = trim(cfg.output_name);
  if (name.empty() || name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
    throw std::runtime_error("Config: output_name must be a plain file name (got '" + cfg.output_name + "')");
  }
}

} // namespace iatscore
