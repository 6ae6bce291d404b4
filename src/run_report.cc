#include "run_report.hh"
#include "error_handler.hh"
#include <algorithm>
#include <fstream>

void RunReport::RecordDecodeFailure(const std::string& path) {
    if (std::find(decode_failures_.begin(), decode_failures_.end(), path) == decode_failures_.end()) {
        decode_failures_.push_back(path);
    }
}

void RunReport::RecordRenderFailure(const std::string& path, const std::string& reason) {
    render_failures_.push_back({path, reason});
}

void RunReport::RecordMissingPhase(const std::string& phase, const std::string& folder) {
    missing_phases_.push_back(phase + " (" + folder + ")");
}

void RunReport::RecordSkippedFolder(const std::string& folder, const std::string& reason) {
    skipped_folders_.push_back({folder, reason});
}

void RunReport::RecordStamped(size_t records, size_t rendered) {
    records_ += records;
    rendered_ += rendered;
}

bool RunReport::HasFailures() const {
    return !decode_failures_.empty() || !render_failures_.empty() || !missing_phases_.empty() ||
           !skipped_folders_.empty();
}

void RunReport::LogSummary() const {
    LOG_INFO("RunReport", "Records: " + std::to_string(records_) +
             ", rendered: " + std::to_string(rendered_) +
             ", decode failures: " + std::to_string(decode_failures_.size()) +
             ", render failures: " + std::to_string(render_failures_.size()));

    for (const auto& skipped : skipped_folders_) {
        LOG_WARNING("RunReport", "Skipped folder: " + skipped.path + " (" + skipped.reason + ")");
    }
    for (const auto& phase : missing_phases_) {
        LOG_WARNING("RunReport", "Empty or missing phase: " + phase);
    }
    for (const auto& path : decode_failures_) {
        LOG_WARNING("RunReport", "Decode failed, default distance used: " + path);
    }
    for (const auto& failure : render_failures_) {
        LOG_WARNING("RunReport", "Not stamped: " + failure.path + " (" + failure.reason + ")");
    }
}

json RunReport::ToJson() const {
    json j;
    j["records"] = records_;
    j["rendered"] = rendered_;
    j["decode_failures"] = decode_failures_;
    j["missing_phases"] = missing_phases_;

    json render = json::array();
    for (const auto& failure : render_failures_) {
        render.push_back(json{{"path", failure.path}, {"reason", failure.reason}});
    }
    j["render_failures"] = render;

    json skipped = json::array();
    for (const auto& folder : skipped_folders_) {
        skipped.push_back(json{{"folder", folder.path}, {"reason", folder.reason}});
    }
    j["skipped_folders"] = skipped;
    return j;
}

bool RunReport::Save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("RunReport", "Failed to open report file: " + path);
        return false;
    }
    file << ToJson().dump(2) << std::endl;
    LOG_INFO("RunReport", "Report written to " + path);
    return true;
}
