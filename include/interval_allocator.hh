#ifndef INTERVAL_ALLOCATOR_HH
#define INTERVAL_ALLOCATOR_HH

#include <cstddef>
#include <vector>

// Splits a duration budget over the gaps between consecutive photos in
// proportion to their dissimilarity scores.
//
// Guarantees: result.size() == scores.size(), every delta >= 0, and the
// deltas sum to total_seconds (the last delta absorbs rounding).
class IntervalAllocator {
public:
    IntervalAllocator();
    explicit IntervalAllocator(double min_delta_seconds);
    ~IntervalAllocator();

    // Throws std::invalid_argument for a negative budget or score.
    std::vector<double> Allocate(const std::vector<double>& scores, double total_seconds) const;

    void SetMinDelta(double min_delta_seconds);
    double GetMinDelta() const { return min_delta_; }

private:
    std::vector<double> EqualSplit(size_t count, double total_seconds) const;
    // Water-filling: pairs whose proportional share falls under the floor
    // are pinned to it, the rest of the budget is re-split among the others.
    std::vector<double> ApplyFloor(const std::vector<double>& scores, double total_seconds) const;
    void AbsorbRemainder(std::vector<double>& deltas, double total_seconds) const;

    double min_delta_ = 0.0;
};

#endif // INTERVAL_ALLOCATOR_HH
