#ifndef STAMP_DISPATCHER_HH
#define STAMP_DISPATCHER_HH

#include <random>
#include <string>
#include <vector>
#include "run_report.hh"
#include "stamp_formatter.hh"
#include "stamp_renderer.hh"
#include "stamp_types.hh"

// Pairs every timed photo with a random location, formats its timestamp
// and hands both to the renderer. A failed render is reported and skipped.
class StampDispatcher {
public:
    // Throws ConfigError when locations is empty
    StampDispatcher(StampRenderer& renderer, const StampFormatter& formatter,
                    const std::vector<std::string>& locations);
    ~StampDispatcher();

    std::vector<StampRecord> Dispatch(const std::vector<TimedPhoto>& timeline,
                                      std::mt19937& rng, RunReport& report);

    StampRecord MakeRecord(const TimedPhoto& timed, std::mt19937& rng) const;

private:
    StampRenderer& renderer_;
    const StampFormatter& formatter_;
    std::vector<std::string> locations_;
};

#endif // STAMP_DISPATCHER_HH
