#include "interval_allocator.hh"
#include "error_handler.hh"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

IntervalAllocator::IntervalAllocator() {}

IntervalAllocator::IntervalAllocator(double min_delta_seconds) {
    SetMinDelta(min_delta_seconds);
}

IntervalAllocator::~IntervalAllocator() {}

void IntervalAllocator::SetMinDelta(double min_delta_seconds) {
    if (min_delta_seconds < 0.0 || !std::isfinite(min_delta_seconds)) {
        throw std::invalid_argument("Minimum delta must be a non-negative number");
    }
    min_delta_ = min_delta_seconds;
}

std::vector<double> IntervalAllocator::Allocate(const std::vector<double>& scores,
                                                double total_seconds) const {
    if (total_seconds < 0.0 || !std::isfinite(total_seconds)) {
        throw std::invalid_argument("Duration budget must be a non-negative number");
    }
    for (double score : scores) {
        if (score < 0.0 || !std::isfinite(score)) {
            throw std::invalid_argument("Dissimilarity scores must be non-negative");
        }
    }

    if (scores.empty()) {
        return {};
    }

    const size_t n = scores.size();
    double score_sum = std::accumulate(scores.begin(), scores.end(), 0.0);

    std::vector<double> deltas;
    if (min_delta_ > 0.0 && total_seconds > 0.0) {
        if (min_delta_ * static_cast<double>(n) >= total_seconds) {
            LOG_WARNING("IntervalAllocator", "Budget of " + std::to_string(total_seconds) +
                        "s cannot honor a " + std::to_string(min_delta_) + "s floor over " +
                        std::to_string(n) + " gaps, splitting evenly");
            deltas = EqualSplit(n, total_seconds);
        } else {
            deltas = ApplyFloor(scores, total_seconds);
        }
    } else if (score_sum <= 0.0) {
        deltas = EqualSplit(n, total_seconds);
    } else {
        deltas.resize(n);
        for (size_t i = 0; i < n; ++i) {
            deltas[i] = total_seconds * scores[i] / score_sum;
        }
    }

    AbsorbRemainder(deltas, total_seconds);
    return deltas;
}

// --- PRIVATE HELPER METHODS ---

std::vector<double> IntervalAllocator::EqualSplit(size_t count, double total_seconds) const {
    return std::vector<double>(count, total_seconds / static_cast<double>(count));
}

std::vector<double> IntervalAllocator::ApplyFloor(const std::vector<double>& scores,
                                                  double total_seconds) const {
    const size_t n = scores.size();
    std::vector<double> deltas(n, 0.0);
    std::vector<bool> floored(n, false);
    size_t floored_count = 0;

    // Each pass pins at least one more pair or terminates, so this ends
    // after at most n passes.
    while (true) {
        double remaining = total_seconds - min_delta_ * static_cast<double>(floored_count);
        double free_sum = 0.0;
        size_t free_count = 0;
        for (size_t i = 0; i < n; ++i) {
            if (!floored[i]) {
                free_sum += scores[i];
                ++free_count;
            }
        }

        for (size_t i = 0; i < n; ++i) {
            if (floored[i]) {
                deltas[i] = min_delta_;
            } else if (free_sum > 0.0) {
                deltas[i] = remaining * scores[i] / free_sum;
            } else {
                deltas[i] = remaining / static_cast<double>(free_count);
            }
        }

        bool pinned_any = false;
        for (size_t i = 0; i < n; ++i) {
            if (!floored[i] && deltas[i] < min_delta_) {
                floored[i] = true;
                ++floored_count;
                pinned_any = true;
            }
        }
        if (!pinned_any) {
            break;
        }
    }

    if (floored_count > 0) {
        LOG_DEBUG("IntervalAllocator", std::to_string(floored_count) + " of " +
                  std::to_string(n) + " gaps raised to the minimum delta");
    }
    return deltas;
}

void IntervalAllocator::AbsorbRemainder(std::vector<double>& deltas, double total_seconds) const {
    double head = 0.0;
    for (size_t i = 0; i + 1 < deltas.size(); ++i) {
        head += deltas[i];
    }
    deltas.back() = std::max(0.0, total_seconds - head);
}
