#include "test_support.hpp"

#include "iatscore/scoring.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

static bool near(double a, double b, double tol = 1e-9) { return std::fabs(a - b) <= tol; }

int main() {
  using namespace iatscore;

  // Second-chance correction: only differing pairs are penalized.
  {
    SegmentTrials t;
    t.rt_with_retry = {500.0, 250.0, 100.0, 812.25};
    t.rt_keyboard = {500.0, 250.0, 400.0, 812.0};

    const CorrectedSegment c = correct_responses(t, 600.0);
    assert(c.rt.size() == 4);
    assert(c.rt[0] == 500.0);
    assert(c.rt[1] == 250.0);
    assert(c.rt[2] == 700.0);
    assert(c.rt[3] == 1412.25);
    assert(c.n_errors == 2);
  }

  // Penalty is a parameter.
  {
    SegmentTrials t;
    t.rt_with_retry = {100.0};
    t.rt_keyboard = {400.0};
    const CorrectedSegment c = correct_responses(t, 0.0);
    assert(c.rt[0] == 100.0);
    assert(c.n_errors == 1);
  }

  {
    SegmentTrials t;
    t.rt_with_retry = {1.0, 2.0};
    t.rt_keyboard = {1.0};
    bool threw = false;
    try {
      (void)correct_responses(t, 600.0);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // Clipping: below floor -> floor, within range unchanged, above ceiling -> ceiling.
  {
    std::vector<double> rt = {250.0, 700.0, 300.0, 3000.0, 4200.0};
    clip_response_times(&rt, 300.0, 3000.0);
    assert(rt[0] == 300.0);
    assert(rt[1] == 700.0);
    assert(rt[2] == 300.0);
    assert(rt[3] == 3000.0);
    assert(rt[4] == 3000.0);

    // Idempotent.
    const std::vector<double> once = rt;
    clip_response_times(&rt, 300.0, 3000.0);
    assert(rt == once);
  }

  // Summary drops the leading trial and uses the (n-1) standard deviation.
  {
    std::vector<double> rt(40, 500.0);
    rt[0] = 3000.0;
    const SegmentSummary s = summarize_segment(rt, 1);
    assert(s.n_trials == 39);
    assert(s.mean == 500.0);
    assert(s.stddev == 0.0);
  }
  {
    const std::vector<double> rt = {9999.0, 2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    const SegmentSummary s = summarize_segment(rt, 1);
    assert(s.n_trials == 8);
    assert(near(s.mean, 5.0));
    // Sum of squared deviations is 32: sample variance 32 / 7.
    assert(near(s.stddev, std::sqrt(32.0 / 7.0)));
  }
  {
    const std::vector<double> rt = {1.0, 2.0, 3.0};
    const SegmentSummary s = summarize_segment(rt, 0);
    assert(near(s.mean, 2.0));
    assert(near(s.stddev, 1.0));
  }
  {
    bool threw = false;
    try {
      (void)summarize_segment({500.0, 600.0}, 1);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "test_response_correction OK\n";
  return 0;
}
