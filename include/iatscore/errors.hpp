#pragma once

#include <stdexcept>
#include <string>

namespace iatscore {

// Error kinds raised by the scoring pipeline.
//
// All of them derive from std::runtime_error so tools that only catch the
// standard hierarchy still report a readable message. The messages always name
// the offending file so an operator can fix the source data.

// Participant or block number cannot be resolved from a filename, or the
// filename is ambiguous (e.g. "block1_block2").
class FilenamePatternError : public std::runtime_error {
public:
  FilenamePatternError(const std::string& path, const std::string& detail)
      : std::runtime_error("Filename pattern error: " + path + ": " + detail), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// A trial log lacks the rows, columns or numeric cells required by the trial
// segments.
class MissingDataError : public std::runtime_error {
public:
  MissingDataError(const std::string& path, const std::string& detail)
      : std::runtime_error("Missing data: " + path + ": " + detail), path_(path) {}

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

// Input unreadable or output unwritable.
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace iatscore
