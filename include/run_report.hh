#ifndef RUN_REPORT_HH
#define RUN_REPORT_HH

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Recoverable problems of one run, collected instead of raised
class RunReport {
public:
    void RecordDecodeFailure(const std::string& path);
    void RecordRenderFailure(const std::string& path, const std::string& reason);
    void RecordMissingPhase(const std::string& phase, const std::string& folder);
    void RecordSkippedFolder(const std::string& folder, const std::string& reason);
    void RecordStamped(size_t records, size_t rendered);

    bool HasFailures() const;
    size_t DecodeFailureCount() const { return decode_failures_.size(); }
    size_t RenderFailureCount() const { return render_failures_.size(); }
    const std::vector<std::string>& DecodeFailures() const { return decode_failures_; }
    size_t SkippedFolderCount() const { return skipped_folders_.size(); }
    size_t RecordCount() const { return records_; }
    size_t RenderedCount() const { return rendered_; }

    // Logs a summary; failures are always listed when present
    void LogSummary() const;
    json ToJson() const;
    bool Save(const std::string& path) const;

private:
    struct PathFailure {
        std::string path;
        std::string reason;
    };

    std::vector<std::string> decode_failures_;
    std::vector<PathFailure> render_failures_;
    std::vector<std::string> missing_phases_;
    std::vector<PathFailure> skipped_folders_;
    size_t records_ = 0;
    size_t rendered_ = 0;
};

#endif // RUN_REPORT_HH
