#ifndef INCIDENT_BATCH_HH
#define INCIDENT_BATCH_HH

#include <string>
#include <vector>
#include "image_difference.hh"
#include "run_config.hh"
#include "run_report.hh"
#include "stamp_renderer.hh"
#include "stamp_types.hh"

// Runs the phase pipeline once per incident folder below the configured
// root. Every incident gets its own clock and date; problems of one
// incident are reported and do not stop the others.
class IncidentBatch {
public:
    IncidentBatch(const RunConfig& config, const ImageDecoder& decoder);
    ~IncidentBatch();

    // Direct subfolders of root, sorted by name
    static std::vector<std::string> ListIncidents(const std::string& root);

    std::vector<TimedPhoto> Plan(RunReport& report);
    std::vector<StampRecord> Run(StampRenderer& renderer, RunReport& report);

private:
    // Incidents that could be dated, each with its own seed when seeded
    std::vector<RunConfig> IncidentConfigs(RunReport& report) const;

    RunConfig config_;
    const ImageDecoder& decoder_;
};

#endif // INCIDENT_BATCH_HH
