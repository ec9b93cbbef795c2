#include "iatscore/run_meta.hpp"

#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace iatscore;

int main() {
  const std::string path = "test_run_meta_write_tmp.json";
  const std::string tmp_prefix = path + ".tmp.";

  // Cleanup any leftovers from an interrupted run.
  {
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator(".", ec)) {
      if (ec) break;
      const std::string name = e.path().filename().u8string();
      if (name == path || name.rfind(tmp_prefix, 0) == 0) {
        std::filesystem::remove(e.path(), ec);
        ec.clear();
      }
    }
  }

  const bool ok = write_run_meta_json(path,
                                      "iatscore_cli",
                                      "results",
                                      "data/\"lab A\"",
                                      3,
                                      1,
                                      {"opensesameResults.csv", "iat_score_report.txt", "opensesameResults.csv", " "});
  assert(ok);

  std::string text;
  {
    std::ifstream f(path, std::ios::binary);
    assert(f);
    std::stringstream ss;
    ss << f.rdbuf();
    text = ss.str();
  }

  assert(text.find("\"Tool\": \"iatscore_cli\"") != std::string::npos);
  assert(text.find("\"InputPath\": \"data/\\\"lab A\\\"\"") != std::string::npos);
  assert(text.find("\"Warnings\": 3") != std::string::npos);
  assert(text.find("\"Errors\": 1") != std::string::npos);
  assert(text.find("\"TimestampUTC\": \"") != std::string::npos);
  assert(text.find("TimestampLocal") == std::string::npos);

  // Outputs are de-duplicated and blank entries dropped.
  const size_t first = text.find("\"opensesameResults.csv\"");
  assert(first != std::string::npos);
  assert(text.find("\"opensesameResults.csv\"", first + 1) == std::string::npos);
  assert(text.find("\"iat_score_report.txt\"") != std::string::npos);
  assert(text.find("\" \"") == std::string::npos);

  // No temporary file is left behind.
  {
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator(".", ec)) {
      if (ec) break;
      assert(e.path().filename().u8string().rfind(tmp_prefix, 0) != 0);
    }
  }

  std::filesystem::remove(path);

  std::cout << "test_run_meta_write OK\n";
  return 0;
}
