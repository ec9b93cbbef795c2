#include "iatscore/run_meta.hpp"

#include "iatscore/utils.hpp"
#include "iatscore/version.hpp"

#include <sstream>
#include <unordered_set>

namespace iatscore {

bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::string& input_path,
                         size_t n_warnings,
                         size_t n_errors,
                         const std::vector<std::string>& outputs) {
  std::ostringstream out;

  out << "{\n";
  out << "  \"Tool\": \"" << json_escape(tool) << "\",\n";
  out << "  \"IatscoreVersion\": \"" << json_escape(version_string()) << "\",\n";
  out << "  \"BuildType\": \"" << json_escape(build_type_string()) << "\",\n";
  out << "  \"Compiler\": \"" << json_escape(compiler_string()) << "\",\n";
  out << "  \"CppStandard\": \"" << json_escape(cpp_standard_string()) << "\",\n";
  out << "  \"TimestampUTC\": \"" << json_escape(now_string_utc()) << "\",\n";
  out << "  \"OutputDir\": \"" << json_escape(outdir) << "\",\n";
  out << "  \"InputPath\": ";
  if (input_path.empty()) {
    out << "null";
  } else {
    out << "\"" << json_escape(input_path) << "\"";
  }
  out << ",\n";
  out << "  \"Warnings\": " << n_warnings << ",\n";
  out << "  \"Errors\": " << n_errors << ",\n";

  // De-duplicate, keeping first-seen order.
  std::vector<std::string> unique_outputs;
  std::unordered_set<std::string> seen;
  for (const auto& o : outputs) {
    const std::string t = trim(o);
    if (t.empty()) continue;
    if (seen.insert(t).second) unique_outputs.push_back(t);
  }

  out << "  \"Outputs\": [\n";
  for (size_t i = 0; i < unique_outputs.size(); ++i) {
    out << "    \"" << json_escape(unique_outputs[i]) << "\"";
    if (i + 1 < unique_outputs.size()) out << ",";
    out << "\n";
  }
  out << "  ]\n";
  out << "}\n";
  return write_text_file_atomic(json_path, out.str());
}

} // namespace iatscore
