#include "stamp_dispatcher.hh"
#include "error_handler.hh"

StampDispatcher::StampDispatcher(StampRenderer& renderer, const StampFormatter& formatter,
                                 const std::vector<std::string>& locations)
    : renderer_(renderer), formatter_(formatter), locations_(locations) {
    if (locations_.empty()) {
        throw ConfigError("LOCATIONS", "at least one location is required");
    }
}

StampDispatcher::~StampDispatcher() {}

StampRecord StampDispatcher::MakeRecord(const TimedPhoto& timed, std::mt19937& rng) const {
    std::uniform_int_distribution<size_t> pick(0, locations_.size() - 1);
    const std::string& location = locations_[pick(rng)];
    return StampRecord{timed.photo, timed.phase, timed.at, formatter_.Format(timed.at), location};
}

std::vector<StampRecord> StampDispatcher::Dispatch(const std::vector<TimedPhoto>& timeline,
                                                   std::mt19937& rng, RunReport& report) {
    std::vector<StampRecord> records;
    records.reserve(timeline.size());
    size_t rendered = 0;

    for (const auto& timed : timeline) {
        records.push_back(MakeRecord(timed, rng));
        const StampRecord& record = records.back();

        bool success = false;
        std::string reason = "renderer reported failure";
        try {
            success = renderer_.Render(record.photo, record.formatted_timestamp, record.location);
        } catch (const std::exception& e) {
            LOG_EXCEPTION(e, "Dispatcher", record.photo.path);
            reason = e.what();
        }

        if (success) {
            ++rendered;
        } else {
            report.RecordRenderFailure(record.photo.path, reason);
        }
    }

    report.RecordStamped(records.size(), rendered);
    LOG_INFO("Dispatcher", "Stamped " + std::to_string(rendered) + " of " +
             std::to_string(records.size()) + " photos");
    return records;
}
