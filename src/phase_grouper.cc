#include "phase_grouper.hh"
#include "error_handler.hh"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace {

std::string BaseName(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool IsCandidateImage(const std::string& filename) {
    std::string lower = ToLower(filename);
    if (lower.find("_stamped") != std::string::npos) {
        return false;
    }
    std::string ext = ToLower(fs::path(filename).extension().string());
    return ext == ".jpg" || ext == ".jpeg" || ext == ".png";
}

} // namespace

GroupKey ExtractGroupKey(const std::string& filename) {
    size_t digits = 0;
    while (digits < filename.size() && std::isdigit(static_cast<unsigned char>(filename[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits >= filename.size() ||
        (filename[digits] != '_' && filename[digits] != '-')) {
        return {"", filename};
    }
    return {filename.substr(0, digits), filename.substr(digits + 1)};
}

std::string ExtractVariantPrefix(const std::string& filename) {
    size_t end = 0;
    while (end < filename.size() &&
           (std::isdigit(static_cast<unsigned char>(filename[end])) || filename[end] == '_')) {
        ++end;
    }
    std::string prefix = filename.substr(0, end);
    while (!prefix.empty() && prefix.back() == '_') {
        prefix.pop_back();
    }
    return prefix.empty() ? filename : prefix;
}

PhaseGrouper::PhaseGrouper() {}
PhaseGrouper::~PhaseGrouper() {}

// --- PUBLIC METHODS ---

std::vector<std::string> PhaseGrouper::ListPhotos(const std::string& folder) {
    std::vector<std::string> paths;

    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        LOG_WARNING("PhaseGrouper", "Phase folder not found: " + folder);
        return paths;
    }

    for (const auto& entry : fs::directory_iterator(folder, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string name = entry.path().filename().string();
        if (IsCandidateImage(name)) {
            paths.push_back(entry.path().string());
        }
    }
    if (ec) {
        LOG_WARNING("PhaseGrouper", "Failed to list " + folder + ": " + ec.message());
    }

    std::sort(paths.begin(), paths.end(), [](const std::string& a, const std::string& b) {
        std::string na = BaseName(a), nb = BaseName(b);
        return na != nb ? na < nb : a < b;
    });
    return paths;
}

std::vector<PhotoGroup> PhaseGrouper::Group(const std::string& phase,
                                            const std::vector<std::string>& paths) const {
    std::vector<std::string> sorted = paths;
    std::stable_sort(sorted.begin(), sorted.end(), [](const std::string& a, const std::string& b) {
        return BaseName(a) < BaseName(b);
    });

    if (collapse_variants_) {
        sorted = CollapseVariants(sorted);
    }

    std::vector<PhotoGroup> groups;
    std::map<std::string, size_t> index_by_key;

    for (const auto& path : sorted) {
        std::string name = BaseName(path);
        GroupKey key = ExtractGroupKey(name);

        auto it = index_by_key.find(key.key);
        if (it == index_by_key.end()) {
            PhotoGroup group;
            group.phase = phase;
            group.key = key.key;
            groups.push_back(group);
            it = index_by_key.emplace(key.key, groups.size() - 1).first;
        }
        groups[it->second].photos.push_back({path, name});
    }

    LOG_DEBUG("PhaseGrouper", "Phase '" + phase + "': " + std::to_string(sorted.size()) +
              " photos in " + std::to_string(groups.size()) + " groups");
    return groups;
}

// --- PRIVATE HELPER METHODS ---

std::vector<std::string> PhaseGrouper::CollapseVariants(const std::vector<std::string>& sorted_paths) const {
    std::vector<std::string> kept;
    std::map<std::string, size_t> index_by_prefix;

    for (const auto& path : sorted_paths) {
        std::string name = BaseName(path);
        std::string prefix = ExtractVariantPrefix(name);

        auto it = index_by_prefix.find(prefix);
        if (it == index_by_prefix.end()) {
            index_by_prefix.emplace(prefix, kept.size());
            kept.push_back(path);
        } else if (name.size() > BaseName(kept[it->second]).size()) {
            LOG_DEBUG("PhaseGrouper", "Variant " + name + " replaces " + BaseName(kept[it->second]));
            kept[it->second] = path;
        }
    }
    return kept;
}
