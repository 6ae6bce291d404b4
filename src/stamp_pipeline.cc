#include "stamp_pipeline.hh"
#include "error_handler.hh"
#include "stamp_dispatcher.hh"
#include <fstream>

StampPipeline::StampPipeline(const RunConfig& config, const ImageDecoder& decoder)
    : config_(config),
      rng_(MakeRandomSource(config.seed)),
      estimator_(decoder),
      formatter_(FormatterFor(config)) {
    grouper_.SetCollapseVariants(config_.collapse_variants);

    estimator_.SetDefaultDistance(config_.default_distance);
    estimator_.SetWorkerCount(config_.distance_workers);

    sequencer_.SetJitterFraction(config_.jitter_fraction);
    sequencer_.SetOffsetJitter(config_.offset_jitter_seconds);
    sequencer_.SetMinDelta(config_.min_delta_seconds);
    sequencer_.SetGroupGap(config_.group_gap_seconds);
}

StampPipeline::~StampPipeline() {}

// --- STAGES ---

std::vector<ScoredPhase> StampPipeline::CollectPhases(RunReport& report) const {
    std::vector<ScoredPhase> phases;

    for (const auto& phase_config : config_.phases) {
        std::string folder = config_.PhaseFolder(phase_config);
        std::vector<std::string> listing = PhaseGrouper::ListPhotos(folder);
        if (listing.empty()) {
            report.RecordMissingPhase(phase_config.name, folder);
        }

        ScoredPhase phase;
        phase.budget = phase_config.budget;
        phase.groups = grouper_.Group(phase_config.name, listing);

        for (const auto& group : phase.groups) {
            std::vector<std::string> paths;
            paths.reserve(group.photos.size());
            for (const auto& photo : group.photos) {
                paths.push_back(photo.path);
            }

            DistanceResult distances = estimator_.ComputeSequence(paths);
            for (const auto& failed : distances.failed_paths) {
                report.RecordDecodeFailure(failed);
            }
            phase.scores.push_back(distances.scores);
        }

        LOG_INFO("Pipeline", "Phase '" + phase_config.name + "': " + std::to_string(listing.size()) +
                 " photos, " + std::to_string(phase.groups.size()) + " groups");
        phases.push_back(phase);
    }
    return phases;
}

std::vector<TimedPhoto> StampPipeline::Plan(RunReport& report) {
    std::vector<ScoredPhase> phases = CollectPhases(report);

    StampClock clock(config_.start_date, static_cast<double>(config_.start_seconds));
    if (config_.start_jitter_seconds > 0.0) {
        std::uniform_real_distribution<double> jitter(-config_.start_jitter_seconds,
                                                      config_.start_jitter_seconds);
        clock.Shift(jitter(rng_));
    }
    LOG_INFO("Pipeline", "Clock starts at " + formatter_.Format(clock.Now()));

    return sequencer_.Run(phases, clock, rng_);
}

std::vector<StampRecord> StampPipeline::Run(StampRenderer& renderer, RunReport& report) {
    std::vector<TimedPhoto> timeline = Plan(report);
    if (!config_.schedule_path.empty() && !SaveSchedule(timeline, config_.schedule_path)) {
        LOG_WARNING("Pipeline", "Continuing without a saved schedule");
    }

    return Dispatch(timeline, renderer, report);
}

std::vector<StampRecord> StampPipeline::Dispatch(const std::vector<TimedPhoto>& timeline,
                                                 StampRenderer& renderer, RunReport& report) {
    StampDispatcher dispatcher(renderer, formatter_, config_.locations);
    return dispatcher.Dispatch(timeline, rng_, report);
}

// --- OUTPUT ---

json StampPipeline::ScheduleToJson(const std::vector<TimedPhoto>& timeline) const {
    return TimelineToJson(timeline, formatter_);
}

bool StampPipeline::SaveSchedule(const std::vector<TimedPhoto>& timeline, const std::string& path) const {
    return SaveTimeline(timeline, formatter_, path);
}

StampFormatter FormatterFor(const RunConfig& config) {
    StampFormatter formatter(config.locale);
    if (!config.month_names.empty()) {
        formatter.SetMonthNames(config.month_names);
    }
    return formatter;
}

json TimelineToJson(const std::vector<TimedPhoto>& timeline, const StampFormatter& formatter) {
    json schedule = json::array();
    for (const auto& timed : timeline) {
        schedule.push_back(json{
            {"path", timed.photo.path},
            {"phase", timed.phase},
            {"group", timed.group_key},
            {"date", timed.at.date.ToString()},
            {"seconds_of_day", timed.at.seconds_of_day},
            {"stamp", formatter.Format(timed.at)}
        });
    }
    return schedule;
}

bool SaveTimeline(const std::vector<TimedPhoto>& timeline, const StampFormatter& formatter,
                  const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Pipeline", "Failed to open schedule file: " + path);
        return false;
    }
    file << TimelineToJson(timeline, formatter).dump(2) << std::endl;
    LOG_INFO("Pipeline", "Schedule with " + std::to_string(timeline.size()) + " entries written to " + path);
    return true;
}
