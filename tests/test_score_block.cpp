#include "test_support.hpp"
#include "trial_log_fixture.hpp"

#include "iatscore/errors.hpp"
#include "iatscore/scoring.hpp"

#include <cmath>
#include <iostream>
#include <string>

static bool near(double a, double b, double tol = 1e-9) { return std::fabs(a - b) <= tol; }

int main() {
  using namespace iatscore;
  using iatscore_test::TrialLogRows;
  using iatscore_test::make_trial_log;

  const ScoringConfig cfg;

  // Warm-up trial is excluded: trial 1 of the congruent segment (row 51) is
  // slow, all others are 500 ms with no retry.
  {
    TrialLogRows rows(500.0);
    rows.set(51, 2000.0, 2000.0);
    const BlockSummary b = score_block(make_trial_log(rows, "p05_block1.csv"), cfg);
    assert(b.congruent_mean == 500.0);
    assert(b.congruent_std == 0.0);
    assert(b.congruent_errors == 0);
    assert(b.incongruent_mean == 500.0);
    assert(b.dscore == 0.0);
  }

  // Rows outside the two segments never contribute.
  {
    TrialLogRows rows(500.0);
    for (size_t r = 1; r <= 50; ++r) rows.set(r, 9000.0, 100.0);
    for (size_t r = 91; r <= 120; ++r) rows.set(r, 9000.0, 100.0);
    const BlockSummary b = score_block(make_trial_log(rows), cfg);
    assert(b.congruent_mean == 500.0);
    assert(b.congruent_errors == 0);
    assert(b.incongruent_errors == 0);
  }

  // Correction, clipping and error counts together.
  {
    TrialLogRows rows(500.0);
    rows.set(52, 250.0, 250.0);   // below floor, no retry -> 300
    rows.set(53, 100.0, 400.0);   // retry -> 700
    rows.set(51, 800.0, 700.0);   // retry on the excluded trial still counts as an error
    for (size_t r = 121; r <= 160; ++r) rows.set(r, 900.0, 900.0);
    rows.set(130, 2900.0, 2000.0); // retry -> 3500 -> clipped to 3000

    const BlockSummary b = score_block(make_trial_log(rows), cfg);

    // Congruent rows 52-90: 300 + 700 + 37 * 500.
    const double con_mean = (300.0 + 700.0 + 37.0 * 500.0) / 39.0;
    assert(near(b.congruent_mean, con_mean));
    assert(b.congruent_errors == 2);

    // Incongruent rows 122-160: 38 * 900 + 3000.
    const double inc_mean = (38.0 * 900.0 + 3000.0) / 39.0;
    assert(near(b.incongruent_mean, inc_mean));
    assert(b.incongruent_errors == 1);

    double acc = 38.0 * (900.0 - inc_mean) * (900.0 - inc_mean) + (3000.0 - inc_mean) * (3000.0 - inc_mean);
    assert(near(b.incongruent_std, std::sqrt(acc / 38.0), 1e-6));

    assert(b.dscore == b.congruent_mean - b.incongruent_mean);
    assert(b.dscore < 0.0);
  }

  // Custom constants flow through.
  {
    ScoringConfig c2;
    c2.retry_penalty_ms = 1000.0;
    c2.clip_max_ms = 10000.0;
    c2.exclude_leading_trials = 0;

    TrialLogRows rows(500.0);
    rows.set(51, 500.0, 400.0);
    const BlockSummary b = score_block(make_trial_log(rows), c2);
    assert(near(b.congruent_mean, (39.0 * 500.0 + 1500.0) / 40.0));
    assert(b.congruent_errors == 1);
  }

  // Logs shorter than the incongruent range are a data error, not a default.
  {
    const TrialLogRows rows(500.0, 150);
    bool threw = false;
    try {
      (void)score_block(make_trial_log(rows, "p07_block2.csv"), cfg);
    } catch (const MissingDataError& e) {
      threw = true;
      assert(e.path() == "p07_block2.csv");
      const std::string msg = e.what();
      assert(msg.find("121-160") != std::string::npos);
      assert(msg.find("150") != std::string::npos);
    }
    assert(threw);
  }

  // Missing response-time column.
  {
    TrialLog log = make_trial_log(TrialLogRows(500.0));
    log.columns[2] = "rt_keyboard";
    bool threw = false;
    try {
      (void)score_block(log, cfg);
    } catch (const MissingDataError& e) {
      threw = true;
      assert(std::string(e.what()).find("response_time_keyboard_response") != std::string::npos);
    }
    assert(threw);
  }

  // Empty or non-numeric cells inside a segment.
  {
    TrialLog log = make_trial_log(TrialLogRows(500.0));
    log.rows[69][1] = "NA";
    bool threw = false;
    try {
      (void)score_block(log, cfg);
    } catch (const MissingDataError& e) {
      threw = true;
      assert(std::string(e.what()).find("row 70") != std::string::npos);
    }
    assert(threw);
  }
  {
    TrialLog log = make_trial_log(TrialLogRows(500.0));
    log.rows[140][2] = "fast";
    bool threw = false;
    try {
      (void)score_block(log, cfg);
    } catch (const MissingDataError&) {
      threw = true;
    }
    assert(threw);
  }

  // A bad cell outside both segments is ignored.
  {
    TrialLog log = make_trial_log(TrialLogRows(500.0));
    log.rows[0][1] = "";
    const BlockSummary b = score_block(log, cfg);
    assert(b.dscore == 0.0);
  }

  std::cout << "test_score_block OK\n";
  return 0;
}
