#pragma once

#include "iatscore/types.hpp"

#include <string>

namespace iatscore {

// Reads one experiment log (OpenSesame-style CSV) into a TrialLog.
//
// - The first non-empty line not starting with '#' is the header row. After
//   the header, every non-blank line is a data row, including lines whose
//   first cell starts with '#'.
// - The delimiter is detected from the header (',' by default, ';' or tab when
//   they produce more columns). Delimiters inside quotes are ignored.
// - A UTF-8 BOM, CRLF line endings and '#' comment lines above the header are
//   tolerated.
// - Short rows are padded with empty cells; extra trailing empty cells are
//   dropped. Any other column-count mismatch is a MissingDataError.
//
// Cells are kept as text: numeric parsing happens when a segment is extracted,
// so unrelated non-numeric columns never cause a failure.
class TrialLogReader {
public:
  TrialLogReader() = default;

  // Throws IoError if the file cannot be opened, MissingDataError if it has no
  // header row.
  TrialLog read(const std::string& path) const;
};

} // namespace iatscore
