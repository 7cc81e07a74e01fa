#pragma once

#include "market_types.h"
#include <mutex>
#include <vector>

namespace wick {

struct ThresholdState {
    double value{};
    TimePoint updated_at{};
    double last_delta{};
};

// Acceptance threshold that re-estimates itself from each scan's scores.
// Always within [score_min, score_max]; moves at most threshold_max_jump per
// update. Longs must clear value + long_threshold_offset.
class ThresholdController {
public:
    ThresholdController();
    explicit ThresholdController(ThresholdState);

    double value() const;
    double for_side(Side) const;
    ThresholdState state() const;
    void restore(ThresholdState);

    // End-of-scan update from that scan's score sample
    ThresholdState update(const std::vector<double> &scores, std::size_t opened,
                          std::size_t vetoes, TimePoint now);

    // Raise after a scan hit its trade cap
    ThresholdState bump(TimePoint now);

private:
    mutable std::mutex mutex_;
    ThresholdState state_;

    ThresholdState commit(double proposed, TimePoint now);
};

// Pure form of one update step
double next_threshold(double current, const std::vector<double> &scores,
                      std::size_t opened, std::size_t vetoes);

} // namespace wick
