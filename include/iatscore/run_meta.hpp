#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace iatscore {

// Write an *_run_meta.json sidecar describing one scoring run.
//
// Keys written (top-level):
//   Tool, IatscoreVersion, BuildType, Compiler, CppStandard,
//   TimestampUTC, OutputDir, InputPath (string or null),
//   Warnings, Errors (counts), Outputs (file names relative to OutputDir)
//
// Returns true on success, false on write failure.
bool write_run_meta_json(const std::string& json_path,
                         const std::string& tool,
                         const std::string& outdir,
                         const std::string& input_path,
                         size_t n_warnings,
                         size_t n_errors,
                         const std::vector<std::string>& outputs);

} // namespace iatscore
