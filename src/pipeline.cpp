#include "iatscore/pipeline.hpp"

#include "iatscore/errors.hpp"
#include "iatscore/file_locator.hpp"
#include "iatscore/scoring.hpp"
#include "iatscore/trial_log_reader.hpp"
#include "iatscore/utils.hpp"

#include <sstream>

namespace iatscore {

PipelineResult run_pipeline(const std::string& input_root, const RunConfig& cfg) {
  validate_run_config(cfg);

  LocatorOptions opt = cfg.locator;
  opt.collect_errors = cfg.keep_going;

  const LocatedTrialLogs located = locate_trial_logs(input_root, opt);

  PipelineResult result;
  result.n_files_found = located.n_files() + located.errors.size();

  for (const auto& path : located.unmatched) {
    result.warnings.push_back("skipping " + path + ": no participant code (pattern '" +
                              opt.participant_pattern + "')");
  }
  result.warnings.insert(result.warnings.end(), located.warnings.begin(), located.warnings.end());
  result.errors.insert(result.errors.end(), located.errors.begin(), located.errors.end());

  const TrialLogReader reader;

  for (const auto& kv : located.by_participant) {
    const int participant = kv.first;
    result.table.add_participant(participant);

    for (const TrialLogFile& f : kv.second) {
      try {
        const TrialLog log = reader.read(f.path);
        const BlockSummary summary = score_block(log, cfg.scoring);
        if (result.table.set_block(participant, f.block, summary, f.path, &result.warnings)) {
          ++result.n_blocks_scored;
        }
      } catch (const MissingDataError& e) {
        if (!cfg.keep_going) throw;
        result.errors.push_back(e.what());
      } catch (const FilenamePatternError& e) {
        if (!cfg.keep_going) throw;
        result.errors.push_back(e.what());
      } catch (const IoError& e) {
        if (!cfg.keep_going) throw;
        result.errors.push_back(e.what());
      }
    }
  }

  if (located.by_participant.empty()) {
    result.warnings.push_back("no trial logs with a participant code found under " + input_root);
  }

  return result;
}

std::string format_run_report(const std::string& input_root, const PipelineResult& result) {
  std::ostringstream o;
  o << "iatscore report\n";
  o << "Generated (UTC): " << now_string_utc() << "\n";
  o << "Input root: " << input_root << "\n\n";

  o << "Trial logs found: " << result.n_files_found << "\n";
  o << "Participants: " << result.table.size() << "\n";
  o << "Blocks scored: " << result.n_blocks_scored << "\n";
  o << "Warnings: " << result.warnings.size() << "\n";
  o << "Errors: " << result.errors.size() << "\n";

  if (!result.errors.empty()) {
    o << "\nErrors:\n";
    for (const auto& e : result.errors) o << "  - " << e << "\n";
  }
  if (!result.warnings.empty()) {
    o << "\nWarnings:\n";
    for (const auto& w : result.warnings) o << "  - " << w << "\n";
  }
  return o.str();
}

} // namespace iatscore
