#include "iatscore/file_locator.hpp"

#include "iatscore/errors.hpp"
#include "iatscore/pattern.hpp"
#include "iatscore/utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace iatscore {

namespace {

static bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (unsigned char c : s) {
    if (std::isdigit(c) == 0) return false;
  }
  return true;
}

static std::vector<std::filesystem::path> list_candidate_files(const std::filesystem::path& root,
                                                               const LocatorOptions& opt) {
  std::vector<std::filesystem::path> out;
  try {
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied);
    for (const auto& ent : it) {
      if (!ent.is_regular_file()) continue;
      const std::string name = ent.path().filename().u8string();
      if (!wildcard_match(name, opt.file_pattern, false)) continue;
      out.push_back(ent.path());
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw IoError(std::string("Failed to scan input directory: ") + e.what());
  }

  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

size_t LocatedTrialLogs::n_files() const {
  size_t n = 0;
  for (const auto& kv : by_participant) n += kv.second.size();
  return n;
}

std::string format_participant_id(int participant) {
  std::ostringstream oss;
  oss << 'p' << std::setw(2) << std::setfill('0') << participant;
  return oss.str();
}

int parse_participant_number(const std::string& filename, const LocatorOptions& opt) {
  const std::regex re = compile_regex(opt.participant_pattern, opt.case_sensitive);
  const std::vector<std::string> caps = regex_captures(filename, re);
  if (caps.empty()) return -1;
  if (!all_digits(caps.front())) {
    throw FilenamePatternError(filename, "participant pattern captured non-numeric '" + caps.front() + "'");
  }
  try {
    return to_int(caps.front());
  } catch (const std::runtime_error&) {
    throw FilenamePatternError(filename, "participant number '" + caps.front() + "' is out of range");
  }
}

int resolve_block_number(const std::string& path,
                         const std::string& filename,
                         const LocatorOptions& opt,
                         bool* used_fallback) {
  if (used_fallback) *used_fallback = false;

  const std::regex re = compile_regex(opt.block_pattern, opt.case_sensitive);
  const std::vector<std::string> caps = regex_captures(filename, re);
  if (!caps.empty()) {
    int block = -1;
    for (const auto& c : caps) {
      if (!all_digits(c)) {
        throw FilenamePatternError(path, "block pattern '" + opt.block_pattern + "' captured non-numeric '" + c + "'");
      }
      int v = 0;
      try {
        v = to_int(c);
      } catch (const std::runtime_error&) {
        throw FilenamePatternError(path, "block number '" + c + "' is out of range");
      }
      if (block >= 0 && v != block) {
        throw FilenamePatternError(path, "ambiguous block number (pattern '" + opt.block_pattern + "' matched both " +
                                             std::to_string(block) + " and " + std::to_string(v) + ")");
      }
      block = v;
    }
    return block;
  }

  if (opt.block_fallback_offset == 0) {
    throw FilenamePatternError(path, "no block number (expected pattern '" + opt.block_pattern + "')");
  }
  if (filename.size() < opt.block_fallback_offset) {
    throw FilenamePatternError(path, "no block number (expected pattern '" + opt.block_pattern +
                                         "', and the name is too short for the positional fallback)");
  }

  const char c = filename[filename.size() - opt.block_fallback_offset];
  if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
    throw FilenamePatternError(path, "no block number (expected pattern '" + opt.block_pattern +
                                         "' or a digit " + std::to_string(opt.block_fallback_offset) +
                                         " characters from the end, found '" + std::string(1, c) + "')");
  }
  if (used_fallback) *used_fallback = true;
  return c - '0';
}

LocatedTrialLogs locate_trial_logs(const std::string& root_in, const LocatorOptions& opt) {
  const std::filesystem::path root = std::filesystem::u8path(root_in);
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw IoError("Input directory not found: " + root_in);
  }

  LocatedTrialLogs out;

  for (const auto& p : list_candidate_files(root, opt)) {
    const std::string path = p.u8string();
    const std::string name = p.filename().u8string();

    int participant = -1;
    try {
      participant = parse_participant_number(name, opt);
    } catch (const FilenamePatternError& e) {
      if (!opt.collect_errors) throw;
      out.errors.push_back(std::string(e.what()) + " (in " + p.parent_path().u8string() + ")");
      continue;
    }
    if (participant < 0) {
      out.unmatched.push_back(path);
      continue;
    }

    // Every participant with a matching file gets an entry, even if its block
    // cannot be resolved, so it still shows up in the results table.
    auto& files = out.by_participant[participant];

    TrialLogFile f;
    f.path = path;
    f.participant = participant;
    try {
      f.block = resolve_block_number(path, name, opt, &f.block_from_fallback);
    } catch (const FilenamePatternError& e) {
      if (!opt.collect_errors) throw;
      out.errors.push_back(e.what());
      continue;
    }

    if (f.block_from_fallback) {
      out.warnings.push_back("block " + std::to_string(f.block) + " of " + path +
                             " read from character " + std::to_string(opt.block_fallback_offset) +
                             " from the end (no '" + opt.block_pattern + "' token)");
    }
    files.push_back(std::move(f));
  }

  return out;
}

} // namespace iatscore
