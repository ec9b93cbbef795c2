#pragma once

#include "iatscore/utils.hpp"

#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace iatscore {

// Glob-style filename matching:
//  - '*' : matches any sequence (including empty)
//  - '?' : matches exactly one character
//
// Used for the trial-log file filter (e.g. "*.csv").
inline bool wildcard_match(const std::string& text_in,
                           const std::string& pattern_in,
                           bool case_sensitive) {
  std::string text = text_in;
  std::string pattern = pattern_in;
  if (!case_sensitive) {
    text = to_lower(std::move(text));
    pattern = to_lower(std::move(pattern));
  }

  size_t t = 0;
  size_t p = 0;
  size_t star = std::string::npos;
  size_t match = 0;

  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++t;
      ++p;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p;
      ++p;
      match = t;
    } else if (star != std::string::npos) {
      p = star + 1;
      ++match;
      t = match;
    } else {
      return false;
    }
  }

  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

// Compile an ECMAScript regular expression.
// Throws std::runtime_error with a user-friendly message on invalid patterns.
inline std::regex compile_regex(const std::string& pattern, bool case_sensitive) {
  try {
    auto flags = std::regex_constants::ECMAScript;
    if (!case_sensitive) flags |= std::regex_constants::icase;
    return std::regex(pattern, flags);
  } catch (const std::regex_error& e) {
    throw std::runtime_error("Invalid regex pattern: '" + pattern + "': " + e.what());
  }
}

// First capture group of every non-overlapping match, in order.
//
// The pattern must contain at least one capture group; matches where the
// group did not participate are skipped.
inline std::vector<std::string> regex_captures(const std::string& text, const std::regex& re) {
  std::vector<std::string> out;
  auto it = std::sregex_iterator(text.begin(), text.end(), re);
  const auto end = std::sregex_iterator();
  for (; it != end; ++it) {
    const std::smatch& m = *it;
    if (m.size() < 2 || !m[1].matched) continue;
    out.push_back(m[1].str());
  }
  return out;
}

} // namespace iatscore
