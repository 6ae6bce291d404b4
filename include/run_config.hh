#ifndef RUN_CONFIG_HH
#define RUN_CONFIG_HH

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "stamp_clock.hh"
#include "stamp_types.hh"

using json = nlohmann::json;

struct PhaseConfig {
    std::string name;
    std::string folder; // relative to folder_path unless absolute
    DurationBudget budget;
};

// single: folder_path holds the phase folders of one incident.
// batch:  every subfolder of folder_path is an incident with its own phase
//         folders and its own date.
// days:   every leaf folder is one dated day; one photo each, stamped at a
//         random time inside the day window.
enum class RunMode {
    SINGLE,
    BATCH,
    DAYS
};

// Settings of one stamping run. Everything is validated on load; any
// problem throws ConfigError naming the offending key or phase.
struct RunConfig {
    RunMode mode = RunMode::SINGLE;
    std::string folder_path;
    CalendarDate start_date;
    bool start_date_explicit = false;
    int64_t start_seconds = 0;
    double day_window_seconds = 0.0;
    std::vector<PhaseConfig> phases;
    std::vector<std::string> locations;

    double jitter_fraction = 0.0;
    double min_delta_seconds = 0.0;
    double default_distance = 0.5;
    double start_jitter_seconds = 0.0;
    double offset_jitter_seconds = 0.0;
    double group_gap_seconds = 0.0;
    std::optional<uint32_t> seed;
    unsigned int distance_workers = 1;
    bool collapse_variants = false;

    std::string locale = "ru";
    std::vector<std::string> month_names;
    bool rotate_landscape = true;
    int max_dimension = 2000;

    std::string log_file;
    std::string report_path;
    std::string schedule_path;
    bool verbose = false;

    static RunConfig LoadFromFile(const std::string& config_path);
    static RunConfig FromJson(const json& data);

    std::string PhaseFolder(const PhaseConfig& phase) const;

    // Single-incident settings rooted at incident_folder. Unless start_date
    // was set explicitly, the date comes from the incident folder name or,
    // failing that, from its first dated subfolder. Throws ConfigError
    // naming the folder when no date can be found.
    RunConfig ForIncident(const std::string& incident_folder) const;
};

// Seeded when a seed is configured, otherwise from std::random_device
std::mt19937 MakeRandomSource(const std::optional<uint32_t>& seed);

// Seconds as a number, or "HH:MM:SS". Throws ConfigError(subject, ...).
double ParseDurationValue(const json& value, const std::string& subject);

#endif // RUN_CONFIG_HH
