#include "incident_batch.hh"
#include "error_handler.hh"
#include "stamp_pipeline.hh"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

IncidentBatch::IncidentBatch(const RunConfig& config, const ImageDecoder& decoder)
    : config_(config), decoder_(decoder) {}

IncidentBatch::~IncidentBatch() {}

std::vector<std::string> IncidentBatch::ListIncidents(const std::string& root) {
    std::vector<std::string> incidents;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        LOG_WARNING("IncidentBatch", "Incident root not found: " + root);
        return incidents;
    }

    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (entry.is_directory()) {
            incidents.push_back(entry.path().string());
        }
    }
    if (ec) {
        LOG_WARNING("IncidentBatch", "Failed to list " + root + ": " + ec.message());
    }
    std::sort(incidents.begin(), incidents.end());
    return incidents;
}

// --- PUBLIC METHODS ---

std::vector<TimedPhoto> IncidentBatch::Plan(RunReport& report) {
    std::vector<TimedPhoto> timeline;
    for (const auto& incident : IncidentConfigs(report)) {
        StampPipeline pipeline(incident, decoder_);
        std::vector<TimedPhoto> planned = pipeline.Plan(report);
        timeline.insert(timeline.end(), planned.begin(), planned.end());
    }
    return timeline;
}

std::vector<StampRecord> IncidentBatch::Run(StampRenderer& renderer, RunReport& report) {
    std::vector<StampRecord> records;
    std::vector<TimedPhoto> timeline;

    for (const auto& incident : IncidentConfigs(report)) {
        LOG_INFO("IncidentBatch", "Processing incident " + incident.folder_path + " (" +
                 incident.start_date.ToString() + ")");
        StampPipeline pipeline(incident, decoder_);
        std::vector<TimedPhoto> planned = pipeline.Plan(report);
        std::vector<StampRecord> stamped = pipeline.Dispatch(planned, renderer, report);

        timeline.insert(timeline.end(), planned.begin(), planned.end());
        for (const auto& record : stamped) {
            records.push_back(record);
        }
    }

    if (!config_.schedule_path.empty() &&
        !SaveTimeline(timeline, FormatterFor(config_), config_.schedule_path)) {
        LOG_WARNING("IncidentBatch", "Continuing without a saved schedule");
    }
    return records;
}

// --- PRIVATE HELPER METHODS ---

std::vector<RunConfig> IncidentBatch::IncidentConfigs(RunReport& report) const {
    std::vector<RunConfig> configs;
    std::vector<std::string> incidents = ListIncidents(config_.folder_path);
    if (incidents.empty()) {
        report.RecordSkippedFolder(config_.folder_path, "no incident folders");
    }

    for (size_t i = 0; i < incidents.size(); ++i) {
        try {
            RunConfig incident = config_.ForIncident(incidents[i]);
            incident.schedule_path.clear();
            if (config_.seed.has_value()) {
                incident.seed = config_.seed.value() + static_cast<uint32_t>(i);
            }
            configs.push_back(incident);
        } catch (const ConfigError& e) {
            LOG_WARNING("IncidentBatch", std::string("Skipping incident: ") + e.what());
            report.RecordSkippedFolder(incidents[i], "no date in folder names");
        }
    }
    return configs;
}
