#ifndef PHASE_GROUPER_HH
#define PHASE_GROUPER_HH

#include <cstddef>
#include <string>
#include <vector>
#include "stamp_types.hh"

struct GroupKey {
    std::string key;      // leading digit run, empty when the name has none
    std::string residual; // remainder of the filename after the separator
};

// "2_scaffold.jpg" -> {"2", "scaffold.jpg"}; "IMG_0001.jpg" -> {"", "IMG_0001.jpg"}
GroupKey ExtractGroupKey(const std::string& filename);

// Full leading [0-9_]+ prefix with trailing underscores stripped, used for
// variant collapsing. Returns the filename itself when there is no prefix.
std::string ExtractVariantPrefix(const std::string& filename);

class PhaseGrouper {
public:
    PhaseGrouper();
    ~PhaseGrouper();

    // Image files of one phase folder, sorted by filename. Stamped outputs
    // are skipped. A missing folder yields an empty listing.
    static std::vector<std::string> ListPhotos(const std::string& folder);

    // Partition a listing into groups. Paths are sorted by filename first;
    // groups come out in order of first appearance.
    std::vector<PhotoGroup> Group(const std::string& phase,
                                  const std::vector<std::string>& paths) const;

    void SetCollapseVariants(bool enabled) { collapse_variants_ = enabled; }

private:
    std::vector<std::string> CollapseVariants(const std::vector<std::string>& sorted_paths) const;

    bool collapse_variants_ = false;
};

#endif // PHASE_GROUPER_HH
