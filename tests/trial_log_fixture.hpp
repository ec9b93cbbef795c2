#pragma once

// Synthetic OpenSesame-style trial logs for tests.

#include "iatscore/types.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace iatscore_test {

// 160 data rows, both response-time columns equal to `rt`.
struct TrialLogRows {
  std::vector<double> rt_with_retry;
  std::vector<double> rt_keyboard;

  explicit TrialLogRows(double rt = 500.0, size_t n_rows = 160)
      : rt_with_retry(n_rows, rt), rt_keyboard(n_rows, rt) {}

  // 1-based row index, matching the scoring code.
  void set(size_t row, double with_retry, double keyboard) {
    rt_with_retry[row - 1] = with_retry;
    rt_keyboard[row - 1] = keyboard;
  }
};

// Write rows as a CSV with a few extra columns OpenSesame typically logs.
inline void write_trial_log(const std::filesystem::path& path, const TrialLogRows& rows) {
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << "subject_nr,count_trial_sequence,stimulus,response_time,response_time_keyboard_response,correct\n";
  for (size_t i = 0; i < rows.rt_with_retry.size(); ++i) {
    out << 5 << ',' << i << ",\"word, " << i << "\"," << rows.rt_with_retry[i] << ','
        << rows.rt_keyboard[i] << ",1\n";
  }
}

// Same rows as an in-memory TrialLog (no file involved).
inline iatscore::TrialLog make_trial_log(const TrialLogRows& rows, const std::string& path = "memory.csv") {
  iatscore::TrialLog log;
  log.path = path;
  log.columns = {"subject_nr", "response_time", "response_time_keyboard_response"};
  for (size_t i = 0; i < rows.rt_with_retry.size(); ++i) {
    std::ostringstream a;
    std::ostringstream b;
    a << rows.rt_with_retry[i];
    b << rows.rt_keyboard[i];
    log.rows.push_back({"5", a.str(), b.str()});
  }
  return log;
}

} // namespace iatscore_test
