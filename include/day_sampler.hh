#ifndef DAY_SAMPLER_HH
#define DAY_SAMPLER_HH

#include <random>
#include <string>
#include <vector>
#include "run_config.hh"
#include "run_report.hh"
#include "stamp_formatter.hh"
#include "stamp_renderer.hh"
#include "stamp_types.hh"

// One photo per dated day folder. Each leaf folder below the root whose
// name carries a DD.MM.YYYY date contributes the photo with the longest
// filename, stamped at START_TIME plus a uniform draw from the day window.
class DaySampler {
public:
    explicit DaySampler(const RunConfig& config);
    ~DaySampler();

    // Folders without subfolders below root (root included when it has
    // none), sorted by path
    static std::vector<std::string> ListDayFolders(const std::string& root);
    // Longest filename wins; the earlier name in sort order on a tie
    static std::string PickPhoto(const std::vector<std::string>& paths);

    std::vector<TimedPhoto> Plan(RunReport& report);
    std::vector<StampRecord> Run(StampRenderer& renderer, RunReport& report);

private:
    RunConfig config_;
    std::mt19937 rng_;
    StampFormatter formatter_;
};

#endif // DAY_SAMPLER_HH
