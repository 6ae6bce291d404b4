#ifndef TIMESTAMP_SEQUENCER_HH
#define TIMESTAMP_SEQUENCER_HH

#include <random>
#include <vector>
#include "interval_allocator.hh"
#include "stamp_clock.hh"
#include "stamp_types.hh"

// Walks phases and groups in order and turns allocated gaps into absolute
// timestamps on a run-scoped clock.
//
// Per phase: the start offset (plus optional offset jitter) is consumed
// first, then the phase budget is split over its groups by interval count
// and each group is laid out from the current clock value. After a group
// the clock sits on the group's last timestamp, and the next group starts
// there unless a group gap is configured.
class TimestampSequencer {
public:
    TimestampSequencer();
    ~TimestampSequencer();

    // Validates every phase before producing anything; a bad budget throws
    // ConfigError naming the phase, mismatched score counts throw
    // std::invalid_argument.
    std::vector<TimedPhoto> Run(const std::vector<ScoredPhase>& phases,
                                StampClock& clock, std::mt19937& rng) const;

    // Jitter bound as a fraction of the group's average gap, in [0, 1]
    void SetJitterFraction(double fraction);
    void SetOffsetJitter(double seconds);
    // Pause between consecutive groups of a phase, carved out of the phase
    // budget (at most half of it). Zero keeps groups back to back.
    void SetGroupGap(double seconds);
    void SetMinDelta(double seconds) { allocator_.SetMinDelta(seconds); }

private:
    void Validate(const std::vector<ScoredPhase>& phases) const;
    void SequencePhase(const ScoredPhase& phase, StampClock& clock, std::mt19937& rng,
                       std::vector<TimedPhoto>& out) const;
    void SequenceGroup(const PhotoGroup& group, const std::vector<double>& scores,
                       double budget, StampClock& clock, std::mt19937& rng,
                       std::vector<TimedPhoto>& out) const;

    IntervalAllocator allocator_;
    double jitter_fraction_ = 0.0;
    double offset_jitter_ = 0.0;
    double group_gap_ = 0.0;
};

#endif // TIMESTAMP_SEQUENCER_HH
