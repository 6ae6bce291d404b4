#ifndef STAMP_TYPES_HH
#define STAMP_TYPES_HH

#include <cstddef>
#include <string>
#include <vector>
#include "stamp_clock.hh"

// --- DATA STRUCTURES ---

struct PhotoRef {
    std::string path;
    std::string sort_key; // filename
};

// Photos sharing a filename-derived origin key, in claimed capture order.
// The order is fixed once the group is formed.
struct PhotoGroup {
    std::string phase;
    std::string key;   // empty for the implicit group
    std::vector<PhotoRef> photos;

    size_t IntervalCount() const { return photos.size() > 1 ? photos.size() - 1 : 0; }
};

struct DurationBudget {
    std::string phase;
    double total_seconds = 0.0;
    double start_offset_seconds = 0.0;
};

// One phase ready for sequencing: groups in grouper order, and for every
// group the dissimilarity scores of its consecutive pairs.
struct ScoredPhase {
    DurationBudget budget;
    std::vector<PhotoGroup> groups;
    std::vector<std::vector<double>> scores; // scores[g].size() == groups[g].IntervalCount()
};

// Sequencer output, one per photo
struct TimedPhoto {
    PhotoRef photo;
    std::string phase;
    std::string group_key;
    ClockReading at;
};

// Final per-photo record handed to the renderer. Immutable.
struct StampRecord {
    const PhotoRef photo;
    const std::string phase;
    const ClockReading at;
    const std::string formatted_timestamp;
    const std::string location;
};

#endif // STAMP_TYPES_HH
