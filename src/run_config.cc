#include "run_config.hh"
#include "error_handler.hh"
#include <algorithm>
#include <climits>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

double RequireNonNegative(const json& data, const std::string& key, double fallback) {
    if (!data.contains(key)) {
        return fallback;
    }
    const json& value = data[key];
    if (!value.is_number()) {
        throw ConfigError(key, "expected a number");
    }
    double number = value.get<double>();
    if (number < 0.0 || !std::isfinite(number)) {
        throw ConfigError(key, "must be a non-negative number");
    }
    return number;
}

int PositiveInt(const json& data, const std::string& key, int fallback) {
    if (!data.contains(key)) {
        return fallback;
    }
    const json& value = data[key];
    if (!value.is_number_integer()) {
        throw ConfigError(key, "expected a positive integer");
    }
    bool in_range = value.is_number_unsigned()
                        ? value.get<uint64_t>() >= 1 && value.get<uint64_t>() <= static_cast<uint64_t>(INT_MAX)
                        : value.get<int64_t>() >= 1 && value.get<int64_t>() <= static_cast<int64_t>(INT_MAX);
    if (!in_range) {
        throw ConfigError(key, "expected a positive integer up to " + std::to_string(INT_MAX));
    }
    return static_cast<int>(value.get<int64_t>());
}

bool OptionalBool(const json& data, const std::string& key, bool fallback) {
    if (!data.contains(key)) {
        return fallback;
    }
    if (!data[key].is_boolean()) {
        throw ConfigError(key, "expected true or false");
    }
    return data[key].get<bool>();
}

std::string OptionalString(const json& data, const std::string& key) {
    if (!data.contains(key) || data[key].is_null()) {
        return "";
    }
    if (!data[key].is_string()) {
        throw ConfigError(key, "expected a string");
    }
    return data[key].get<std::string>();
}

std::string FolderName(const std::string& path) {
    std::string name = fs::path(path).lexically_normal().filename().string();
    if (name.empty()) {
        name = fs::path(path).lexically_normal().parent_path().filename().string();
    }
    return name;
}

std::vector<PhaseConfig> ParsePhases(const json& data) {
    if (!data.contains("phases") || !data["phases"].is_array() || data["phases"].empty()) {
        throw ConfigError("phases", "an ordered, non-empty list of phases is required");
    }

    const json durations = data.value("durations", json::object());
    const json offsets = data.value("start_offsets", json::object());
    if (!durations.is_object()) {
        throw ConfigError("durations", "expected a mapping of phase name to duration");
    }
    if (!offsets.is_object()) {
        throw ConfigError("start_offsets", "expected a mapping of phase name to duration");
    }

    std::vector<PhaseConfig> phases;
    for (const auto& entry : data["phases"]) {
        PhaseConfig phase;
        if (entry.is_string()) {
            phase.name = entry.get<std::string>();
            phase.folder = phase.name;
        } else if (entry.is_object() && entry.contains("name") && entry["name"].is_string()) {
            phase.name = entry["name"].get<std::string>();
            phase.folder = entry.value("folder", phase.name);
        } else {
            throw ConfigError("phases", "each phase must be a name or an object with a 'name'");
        }
        if (phase.name.empty()) {
            throw ConfigError("phases", "phase names must not be empty");
        }
        for (const auto& existing : phases) {
            if (existing.name == phase.name) {
                throw ConfigError(phase.name, "phase listed twice");
            }
        }

        if (!durations.contains(phase.name)) {
            throw ConfigError(phase.name, "no duration configured for phase");
        }
        phase.budget.phase = phase.name;
        phase.budget.total_seconds = ParseDurationValue(durations[phase.name], phase.name);
        if (offsets.contains(phase.name)) {
            phase.budget.start_offset_seconds = ParseDurationValue(offsets[phase.name], phase.name);
        }
        phases.push_back(phase);
    }
    return phases;
}

} // namespace

double ParseDurationValue(const json& value, const std::string& subject) {
    double seconds = 0.0;
    if (value.is_number()) {
        seconds = value.get<double>();
    } else if (value.is_string()) {
        try {
            seconds = static_cast<double>(ParseClockTime(value.get<std::string>(), true));
        } catch (const std::invalid_argument& e) {
            throw ConfigError(subject, e.what());
        }
    } else {
        throw ConfigError(subject, "duration must be seconds or \"HH:MM:SS\"");
    }
    if (seconds < 0.0 || !std::isfinite(seconds)) {
        throw ConfigError(subject, "duration must not be negative");
    }
    return seconds;
}

RunConfig RunConfig::LoadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError(config_path, "failed to open config file");
    }

    json data;
    try {
        file >> data;
    } catch (const json::parse_error& e) {
        throw ConfigError(config_path, std::string("invalid JSON: ") + e.what());
    }

    RunConfig config;
    try {
        config = FromJson(data);
    } catch (const json::exception& e) {
        throw ConfigError(config_path, std::string("unexpected value type: ") + e.what());
    }
    LOG_INFO("RunConfig", "Loaded " + std::to_string(config.phases.size()) + " phases from " + config_path);
    return config;
}

RunConfig RunConfig::FromJson(const json& data) {
    if (!data.is_object()) {
        throw ConfigError("config", "top level must be an object");
    }

    RunConfig config;

    config.folder_path = OptionalString(data, "folder_path");
    if (config.folder_path.empty()) {
        throw ConfigError("folder_path", "missing photo root folder");
    }

    if (!data.contains("START_TIME") || !data["START_TIME"].is_string()) {
        throw ConfigError("START_TIME", "missing start time (HH:MM:SS)");
    }
    try {
        config.start_seconds = ParseClockTime(data["START_TIME"].get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("START_TIME", e.what());
    }

    std::string mode = OptionalString(data, "mode");
    if (mode.empty() || mode == "single") {
        config.mode = RunMode::SINGLE;
    } else if (mode == "batch") {
        config.mode = RunMode::BATCH;
    } else if (mode == "days") {
        config.mode = RunMode::DAYS;
    } else {
        throw ConfigError("mode", "expected 'single', 'batch' or 'days'");
    }

    std::string date_text = OptionalString(data, "start_date");
    if (!date_text.empty()) {
        try {
            config.start_date = CalendarDate::Parse(date_text);
        } catch (const std::invalid_argument& e) {
            throw ConfigError("start_date", e.what());
        }
        config.start_date_explicit = true;
    } else if (config.mode == RunMode::SINGLE) {
        std::string folder_name = FolderName(config.folder_path);
        if (!CalendarDate::ExtractFromName(folder_name, config.start_date)) {
            throw ConfigError("start_date", "not set and no DD.MM.YYYY date in folder name '" +
                              folder_name + "'");
        }
    }

    if (config.mode == RunMode::DAYS) {
        if (!data.contains("day_window")) {
            throw ConfigError("day_window", "days mode needs the stamping window after START_TIME");
        }
        config.day_window_seconds = ParseDurationValue(data["day_window"], "day_window");
    } else {
        config.phases = ParsePhases(data);
    }

    if (!data.contains("LOCATIONS") || !data["LOCATIONS"].is_array() || data["LOCATIONS"].empty()) {
        throw ConfigError("LOCATIONS", "a non-empty list of locations is required");
    }
    for (const auto& location : data["LOCATIONS"]) {
        if (!location.is_string()) {
            throw ConfigError("LOCATIONS", "locations must be strings");
        }
        config.locations.push_back(location.get<std::string>());
    }

    config.jitter_fraction = RequireNonNegative(data, "jitter_fraction", 0.0);
    if (config.jitter_fraction > 1.0) {
        throw ConfigError("jitter_fraction", "must not exceed 1");
    }
    config.min_delta_seconds = RequireNonNegative(data, "min_delta_seconds", 0.0);
    config.default_distance = RequireNonNegative(data, "default_distance", 0.5);
    config.start_jitter_seconds = RequireNonNegative(data, "start_jitter_seconds", 0.0);
    config.offset_jitter_seconds = RequireNonNegative(data, "offset_jitter_seconds", 0.0);
    config.group_gap_seconds = RequireNonNegative(data, "group_gap_seconds", 0.0);

    if (data.contains("seed")) {
        const json& seed = data["seed"];
        if (!seed.is_number_integer() || seed.get<int64_t>() < 0 ||
            seed.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
            throw ConfigError("seed", "expected an unsigned 32-bit integer");
        }
        config.seed = data["seed"].get<uint32_t>();
    }

    config.distance_workers = static_cast<unsigned int>(
        PositiveInt(data, "distance_workers", static_cast<int>(config.distance_workers)));

    config.collapse_variants = OptionalBool(data, "collapse_variants", false);
    config.rotate_landscape = OptionalBool(data, "rotate_landscape", true);
    config.verbose = OptionalBool(data, "verbose", false);

    std::string locale = OptionalString(data, "locale");
    if (!locale.empty()) {
        if (locale != "ru" && locale != "en") {
            throw ConfigError("locale", "supported locales are 'ru' and 'en'");
        }
        config.locale = locale;
    }
    if (data.contains("month_names")) {
        const json& names = data["month_names"];
        if (!names.is_array() || names.size() != 12) {
            throw ConfigError("month_names", "expected exactly 12 strings");
        }
        for (const auto& name : names) {
            if (!name.is_string()) {
                throw ConfigError("month_names", "expected exactly 12 strings");
            }
            config.month_names.push_back(name.get<std::string>());
        }
    }

    config.max_dimension = PositiveInt(data, "max_dimension", config.max_dimension);

    config.log_file = OptionalString(data, "log_file");
    config.report_path = OptionalString(data, "report_path");
    config.schedule_path = OptionalString(data, "schedule_path");

    return config;
}

std::string RunConfig::PhaseFolder(const PhaseConfig& phase) const {
    fs::path folder(phase.folder);
    if (folder.is_absolute()) {
        return folder.string();
    }
    return (fs::path(folder_path) / folder).string();
}

RunConfig RunConfig::ForIncident(const std::string& incident_folder) const {
    RunConfig incident = *this;
    incident.mode = RunMode::SINGLE;
    incident.folder_path = incident_folder;
    if (start_date_explicit) {
        return incident;
    }

    std::string name = FolderName(incident_folder);
    if (CalendarDate::ExtractFromName(name, incident.start_date)) {
        return incident;
    }

    std::vector<std::string> subfolders;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(incident_folder, ec)) {
        if (entry.is_directory()) {
            subfolders.push_back(entry.path().filename().string());
        }
    }
    std::sort(subfolders.begin(), subfolders.end());
    for (const auto& subfolder : subfolders) {
        if (CalendarDate::ExtractFromName(subfolder, incident.start_date)) {
            LOG_DEBUG("RunConfig", "Incident " + name + " dated from subfolder " + subfolder);
            return incident;
        }
    }
    throw ConfigError(name, "no DD.MM.YYYY date in the incident folder or its subfolders");
}

std::mt19937 MakeRandomSource(const std::optional<uint32_t>& seed) {
    if (seed.has_value()) {
        return std::mt19937(seed.value());
    }
    std::random_device device;
    return std::mt19937(device());
}
