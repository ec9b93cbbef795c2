#include "iatscore/errors.hpp"
#include "iatscore/pipeline.hpp"
#include "iatscore/run_meta.hpp"
#include "iatscore/scoring_config.hpp"
#include "iatscore/utils.hpp"
#include "iatscore/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace iatscore;

namespace {

struct Args {
  std::string input_dir;
  std::string outdir{"."};
  std::string config_path;

  // Command-line overrides, applied after the config file as key = value.
  std::vector<std::pair<std::string, std::string>> overrides;

  // If true, return a non-zero exit code when any warning was emitted.
  bool strict{false};
};

static void print_help() {
  std::cout
      << "iatscore_cli (Implicit Association Test scoring)\n\n"
      << "Scans a directory tree of per-participant, per-block trial logs (OpenSesame CSV)\n"
      << "and writes one results table with, per block: mean congruent/incongruent RT,\n"
      << "D-score, standard deviations and second-chance error counts.\n\n"
      << "Scoring: RTs that needed a second-chance response get +600 ms, all RTs are\n"
      << "clipped to [300, 3000] ms, and the first trial of each segment is discarded.\n\n"
      << "Outputs (under --outdir):\n"
      << "  opensesameResults.csv   (see --output-name)\n"
      << "  iat_score_report.txt\n"
      << "  iat_score_run_meta.json\n\n"
      << "Usage:\n"
      << "  iatscore_cli --input data --outdir results\n"
      << "  iatscore_cli --input data --config iat.conf --keep-going\n\n"
      << "Options:\n"
      << "  --input DIR                Root directory of the trial logs (searched recursively)\n"
      << "  --outdir DIR               Output directory (default: .)\n"
      << "  --config FILE              key = value settings file (keys listed below)\n"
      << "  --retry-penalty-ms X       Second-chance penalty (default: 600)\n"
      << "  --clip-min X               Lower RT bound in ms (default: 300)\n"
      << "  --clip-max X               Upper RT bound in ms (default: 3000)\n"
      << "  --exclude-leading N        Leading trials dropped per segment (default: 1)\n"
      << "  --output-name NAME         Results file name (default: opensesameResults.csv)\n"
      << "  --keep-going               Record per-file errors and still write the table\n"
      << "  --strict                   Exit non-zero if any warnings were emitted\n"
      << "  --version                  Print the version and exit\n"
      << "  -h, --help                 Show help\n\n"
      << "Config keys: retry_penalty_ms, clip_min_ms, clip_max_ms, exclude_leading_trials,\n"
      << "  congruent_rows (51-90), incongruent_rows (121-160), rt_column,\n"
      << "  rt_keyboard_column, file_pattern (*.csv), participant_pattern (P(\\d{2})),\n"
      << "  block_pattern (block(\\d+)), block_fallback_offset (5, 0 = off),\n"
      << "  case_sensitive (true), output_name, keep_going\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << version_string() << "\n";
      std::exit(0);
    } else if (arg == "--input" && i + 1 < argc) {
      a.input_dir = argv[++i];
    } else if ((arg == "--outdir" || arg == "--out-dir") && i + 1 < argc) {
      a.outdir = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
    } else if (arg == "--retry-penalty-ms" && i + 1 < argc) {
      a.overrides.emplace_back("retry_penalty_ms", argv[++i]);
    } else if (arg == "--clip-min" && i + 1 < argc) {
      a.overrides.emplace_back("clip_min_ms", argv[++i]);
    } else if (arg == "--clip-max" && i + 1 < argc) {
      a.overrides.emplace_back("clip_max_ms", argv[++i]);
    } else if (arg == "--exclude-leading" && i + 1 < argc) {
      a.overrides.emplace_back("exclude_leading_trials", argv[++i]);
    } else if (arg == "--output-name" && i + 1 < argc) {
      a.overrides.emplace_back("output_name", argv[++i]);
    } else if (arg == "--keep-going") {
      a.overrides.emplace_back("keep_going", "true");
    } else if (arg == "--strict") {
      a.strict = true;
    } else {
      throw std::runtime_error("Unknown or incomplete argument: " + arg);
    }
  }
  if (trim(a.input_dir).empty()) {
    throw std::runtime_error("--input is required (use --help for usage)");
  }
  return a;
}

static RunConfig build_config(const Args& args) {
  RunConfig cfg;
  if (!args.config_path.empty()) {
    load_run_config_file(args.config_path, &cfg);
  }
  for (const auto& kv : args.overrides) {
    apply_config_value(&cfg, kv.first, kv.second);
  }
  validate_run_config(cfg);
  return cfg;
}

} // namespace

int main(int argc, char** argv) {
  Args args;
  try {
    args = parse_args(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << "Run with --help for usage.\n";
    return 1;
  }

  try {
    const RunConfig cfg = build_config(args);

    const PipelineResult result = run_pipeline(args.input_dir, cfg);

    for (const auto& w : result.warnings) std::cerr << "Warning: " << w << "\n";
    for (const auto& e : result.errors) std::cerr << "Error: " << e << "\n";

    try {
      ensure_directory(args.outdir);
    } catch (const std::filesystem::filesystem_error& e) {
      throw IoError("Failed to create output directory: " + args.outdir + ": " + e.what());
    }
    const std::filesystem::path outdir = std::filesystem::u8path(args.outdir);
    const std::string results_csv = (outdir / std::filesystem::u8path(cfg.output_name)).u8string();
    const std::string report_txt = (outdir / "iat_score_report.txt").u8string();
    const std::string run_meta = (outdir / "iat_score_run_meta.json").u8string();

    result.table.write_csv(results_csv);

    if (!write_text_file(report_txt, format_run_report(args.input_dir, result))) {
      std::cerr << "Warning: failed to write " << report_txt << "\n";
    }
    if (!write_run_meta_json(run_meta,
                             "iatscore_cli",
                             args.outdir,
                             args.input_dir,
                             result.warnings.size(),
                             result.errors.size(),
                             {cfg.output_name, "iat_score_report.txt"})) {
      std::cerr << "Warning: failed to write run meta JSON: " << run_meta << "\n";
    }

    std::cout << "Participants: " << result.table.size() << "\n";
    std::cout << "Blocks scored: " << result.n_blocks_scored << "\n";
    std::cout << "Warnings: " << result.warnings.size() << "\n";
    std::cout << "Errors: " << result.errors.size() << "\n";
    std::cout << "Wrote: " << results_csv << "\n";
    std::cout << "Wrote: " << report_txt << "\n";

    if (!result.errors.empty()) return 2;
    if (args.strict && !result.warnings.empty()) return 1;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    std::cerr << "No results were written.\n";
    return 2;
  }
}
