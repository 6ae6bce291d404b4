#include "timestamp_sequencer.hh"
#include "error_handler.hh"
#include <algorithm>
#include <cmath>
#include <stdexcept>

TimestampSequencer::TimestampSequencer() {}
TimestampSequencer::~TimestampSequencer() {}

void TimestampSequencer::SetJitterFraction(double fraction) {
    if (fraction < 0.0 || fraction > 1.0 || !std::isfinite(fraction)) {
        throw std::invalid_argument("Jitter fraction must be within [0, 1]");
    }
    jitter_fraction_ = fraction;
}

void TimestampSequencer::SetGroupGap(double seconds) {
    if (seconds < 0.0 || !std::isfinite(seconds)) {
        throw std::invalid_argument("Group gap must be non-negative");
    }
    group_gap_ = seconds;
}

void TimestampSequencer::SetOffsetJitter(double seconds) {
    if (seconds < 0.0 || !std::isfinite(seconds)) {
        throw std::invalid_argument("Offset jitter must be non-negative");
    }
    offset_jitter_ = seconds;
}

// --- PUBLIC METHODS ---

std::vector<TimedPhoto> TimestampSequencer::Run(const std::vector<ScoredPhase>& phases,
                                                StampClock& clock, std::mt19937& rng) const {
    Validate(phases);

    std::vector<TimedPhoto> timeline;
    for (const auto& phase : phases) {
        SequencePhase(phase, clock, rng, timeline);
    }

    LOG_INFO("Sequencer", "Sequenced " + std::to_string(timeline.size()) + " photos over " +
             std::to_string(phases.size()) + " phases");
    return timeline;
}

// --- PRIVATE HELPER METHODS ---

void TimestampSequencer::Validate(const std::vector<ScoredPhase>& phases) const {
    for (const auto& phase : phases) {
        const DurationBudget& budget = phase.budget;
        if (!std::isfinite(budget.total_seconds) || budget.total_seconds < 0.0) {
            throw ConfigError(budget.phase, "duration budget must be a non-negative number");
        }
        if (!std::isfinite(budget.start_offset_seconds) || budget.start_offset_seconds < 0.0) {
            throw ConfigError(budget.phase, "start offset must be a non-negative number");
        }
        if (phase.scores.size() != phase.groups.size()) {
            throw std::invalid_argument("Phase '" + budget.phase + "' has scores for " +
                                        std::to_string(phase.scores.size()) + " of " +
                                        std::to_string(phase.groups.size()) + " groups");
        }
        for (size_t g = 0; g < phase.groups.size(); ++g) {
            if (phase.scores[g].size() != phase.groups[g].IntervalCount()) {
                throw std::invalid_argument("Group '" + phase.groups[g].key + "' of phase '" +
                                            budget.phase + "' expects " +
                                            std::to_string(phase.groups[g].IntervalCount()) +
                                            " scores, got " + std::to_string(phase.scores[g].size()));
            }
        }
    }
}

void TimestampSequencer::SequencePhase(const ScoredPhase& phase, StampClock& clock,
                                       std::mt19937& rng, std::vector<TimedPhoto>& out) const {
    const DurationBudget& budget = phase.budget;

    double offset = budget.start_offset_seconds;
    if (offset_jitter_ > 0.0) {
        std::uniform_real_distribution<double> jitter(-offset_jitter_, offset_jitter_);
        offset = std::max(0.0, offset + jitter(rng));
    }
    clock.Advance(offset);

    if (phase.groups.empty()) {
        LOG_WARNING("Sequencer", "Phase '" + budget.phase + "' has no photos");
        return;
    }

    // Budget share per group, proportional to the number of gaps it has
    std::vector<double> weights;
    weights.reserve(phase.groups.size());
    for (const auto& group : phase.groups) {
        weights.push_back(static_cast<double>(group.IntervalCount()));
    }
    double total_weight = 0.0;
    for (double w : weights) {
        total_weight += w;
    }

    const size_t transitions = phase.groups.size() - 1;
    std::vector<double> group_budgets(phase.groups.size(), 0.0);
    double between_groups = 0.0;
    if (total_weight > 0.0) {
        // Gaps between groups take at most half of the phase budget
        double reserved = 0.0;
        if (transitions > 0 && group_gap_ > 0.0) {
            reserved = std::min(group_gap_ * static_cast<double>(transitions), budget.total_seconds / 2.0);
            between_groups = reserved / static_cast<double>(transitions);
        }
        group_budgets = IntervalAllocator().Allocate(weights, budget.total_seconds - reserved);
    } else if (transitions > 0) {
        // Only single-photo groups: spread the budget over the gaps between them
        between_groups = budget.total_seconds / static_cast<double>(transitions);
    } else if (budget.total_seconds > 0.0) {
        LOG_DEBUG("Sequencer", "Phase '" + budget.phase + "' holds a single photo, budget unused");
    }

    for (size_t g = 0; g < phase.groups.size(); ++g) {
        if (g > 0 && between_groups > 0.0) {
            clock.Advance(between_groups);
        }
        SequenceGroup(phase.groups[g], phase.scores[g], group_budgets[g], clock, rng, out);
    }
}

void TimestampSequencer::SequenceGroup(const PhotoGroup& group, const std::vector<double>& scores,
                                       double budget, StampClock& clock, std::mt19937& rng,
                                       std::vector<TimedPhoto>& out) const {
    if (group.photos.empty()) {
        return;
    }

    std::vector<double> deltas = allocator_.Allocate(scores, budget);

    const size_t n = group.photos.size();
    const double start = clock.Elapsed();

    std::vector<double> nominal(n, start);
    for (size_t i = 1; i < n; ++i) {
        nominal[i] = nominal[i - 1] + deltas[i - 1];
    }

    // Interior photos only, clamped so that every gap keeps the separation
    // the allocator guaranteed and the group's ends stay put. The floor is
    // the configured minimum delta, lowered to the smallest allocated gap
    // when the allocator could not honor it.
    std::vector<double> stamped = nominal;
    if (jitter_fraction_ > 0.0 && n > 2 && budget > 0.0) {
        double gap_floor = std::min(allocator_.GetMinDelta(),
                                    *std::min_element(deltas.begin(), deltas.end()));
        double bound = jitter_fraction_ * budget / static_cast<double>(n - 1);
        std::uniform_real_distribution<double> jitter(-bound, bound);
        for (size_t i = 1; i + 1 < n; ++i) {
            double low = stamped[i - 1] + gap_floor;
            double high = nominal[i + 1] - gap_floor;
            double candidate = nominal[i] + jitter(rng);
            stamped[i] = low <= high ? std::min(std::max(candidate, low), high) : nominal[i];
        }
    }

    for (size_t i = 0; i < n; ++i) {
        TimedPhoto timed;
        timed.photo = group.photos[i];
        timed.phase = group.phase;
        timed.group_key = group.key;
        timed.at = clock.ReadingAt(stamped[i]);
        out.push_back(timed);
    }

    clock.Advance(nominal.back() - start);
}
