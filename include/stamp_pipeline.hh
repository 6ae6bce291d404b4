#ifndef STAMP_PIPELINE_HH
#define STAMP_PIPELINE_HH

#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "image_difference.hh"
#include "phase_grouper.hh"
#include "run_config.hh"
#include "run_report.hh"
#include "stamp_formatter.hh"
#include "stamp_renderer.hh"
#include "stamp_types.hh"
#include "timestamp_sequencer.hh"

using json = nlohmann::json;

// One stamping run: listing -> grouping -> distances -> timestamps -> dispatch.
// All run state (clock, random source) lives here and dies with the object.
class StampPipeline {
public:
    StampPipeline(const RunConfig& config, const ImageDecoder& decoder);
    ~StampPipeline();

    // --- STAGES ---
    std::vector<ScoredPhase> CollectPhases(RunReport& report) const;
    std::vector<TimedPhoto> Plan(RunReport& report);
    // Plan and stamp. Records already produced are kept even when some
    // photos fail to render.
    std::vector<StampRecord> Run(StampRenderer& renderer, RunReport& report);
    // Locations and rendering for an already planned timeline
    std::vector<StampRecord> Dispatch(const std::vector<TimedPhoto>& timeline,
                                      StampRenderer& renderer, RunReport& report);

    // --- OUTPUT ---
    json ScheduleToJson(const std::vector<TimedPhoto>& timeline) const;
    bool SaveSchedule(const std::vector<TimedPhoto>& timeline, const std::string& path) const;

private:
    RunConfig config_;
    std::mt19937 rng_;
    PhaseGrouper grouper_;
    ImageDifferenceEstimator estimator_;
    TimestampSequencer sequencer_;
    StampFormatter formatter_;
};

// Locale table plus any configured month name override
StampFormatter FormatterFor(const RunConfig& config);

// Schedule export: one entry per photo, in timeline order
json TimelineToJson(const std::vector<TimedPhoto>& timeline, const StampFormatter& formatter);
bool SaveTimeline(const std::vector<TimedPhoto>& timeline, const StampFormatter& formatter,
                  const std::string& path);

#endif // STAMP_PIPELINE_HH
