#include "day_sampler.hh"
#include "error_handler.hh"
#include "phase_grouper.hh"
#include "stamp_clock.hh"
#include "stamp_dispatcher.hh"
#include "stamp_pipeline.hh"
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

bool HasSubfolder(const fs::path& folder) {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(folder, ec)) {
        if (entry.is_directory()) {
            return true;
        }
    }
    return false;
}

} // namespace

DaySampler::DaySampler(const RunConfig& config)
    : config_(config),
      rng_(MakeRandomSource(config.seed)),
      formatter_(FormatterFor(config)) {}

DaySampler::~DaySampler() {}

std::vector<std::string> DaySampler::ListDayFolders(const std::string& root) {
    std::vector<std::string> folders;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        LOG_WARNING("DaySampler", "Day root not found: " + root);
        return folders;
    }

    if (!HasSubfolder(root)) {
        folders.push_back(root);
        return folders;
    }
    for (const auto& entry : fs::recursive_directory_iterator(root, ec)) {
        if (entry.is_directory() && !HasSubfolder(entry.path())) {
            folders.push_back(entry.path().string());
        }
    }
    std::sort(folders.begin(), folders.end());
    return folders;
}

std::string DaySampler::PickPhoto(const std::vector<std::string>& paths) {
    std::string picked;
    size_t longest = 0;
    for (const auto& path : paths) {
        size_t length = fs::path(path).filename().string().size();
        if (picked.empty() || length > longest) {
            picked = path;
            longest = length;
        }
    }
    return picked;
}

// --- PUBLIC METHODS ---

std::vector<TimedPhoto> DaySampler::Plan(RunReport& report) {
    std::vector<TimedPhoto> timeline;
    const int64_t window = static_cast<int64_t>(std::floor(config_.day_window_seconds));
    std::uniform_int_distribution<int64_t> offset(0, window);

    for (const auto& folder : ListDayFolders(config_.folder_path)) {
        std::string name = fs::path(folder).filename().string();
        CalendarDate date;
        if (!CalendarDate::ExtractFromName(name, date)) {
            LOG_WARNING("DaySampler", "Folder '" + name + "' does not contain a valid date, skipping");
            report.RecordSkippedFolder(folder, "no date in folder name");
            continue;
        }

        std::string photo = PickPhoto(PhaseGrouper::ListPhotos(folder));
        if (photo.empty()) {
            LOG_INFO("DaySampler", "No suitable images found in folder: " + folder);
            report.RecordSkippedFolder(folder, "no photos");
            continue;
        }

        StampClock clock(date, static_cast<double>(config_.start_seconds));
        clock.Advance(static_cast<double>(offset(rng_)));

        TimedPhoto timed;
        timed.photo = {photo, fs::path(photo).filename().string()};
        timed.phase = name;
        timed.at = clock.Now();
        timeline.push_back(timed);
    }

    LOG_INFO("DaySampler", "Picked " + std::to_string(timeline.size()) + " day photos");
    return timeline;
}

std::vector<StampRecord> DaySampler::Run(StampRenderer& renderer, RunReport& report) {
    std::vector<TimedPhoto> timeline = Plan(report);
    if (!config_.schedule_path.empty() && !SaveTimeline(timeline, formatter_, config_.schedule_path)) {
        LOG_WARNING("DaySampler", "Continuing without a saved schedule");
    }

    StampDispatcher dispatcher(renderer, formatter_, config_.locations);
    return dispatcher.Dispatch(timeline, rng_, report);
}
