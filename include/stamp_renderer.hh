#ifndef STAMP_RENDERER_HH
#define STAMP_RENDERER_HH

#include <cstddef>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include "stamp_types.hh"

// Rendering collaborator. Returns false when the photo could not be stamped.
class StampRenderer {
public:
    virtual ~StampRenderer() = default;
    virtual bool Render(const PhotoRef& photo, const std::string& formatted_timestamp,
                        const std::string& location) = 0;
};

// Draws the stamp into the top-right corner and writes <stem>_stamped.png
// next to the source photo.
//
// Hershey fonts only cover ASCII; other glyphs come out as '?'.
class OpenCvStampRenderer : public StampRenderer {
public:
    OpenCvStampRenderer();
    ~OpenCvStampRenderer() override;

    bool Render(const PhotoRef& photo, const std::string& formatted_timestamp,
                const std::string& location) override;

    // Draw onto an already decoded image, no I/O
    cv::Mat Compose(const cv::Mat& image, const std::vector<std::string>& lines) const;

    static std::string OutputPathFor(const std::string& photo_path);
    // Removes stale *_stamped* outputs below root, returns how many went
    static size_t CleanStampedOutputs(const std::string& root);

    void SetRotateLandscape(bool enabled) { rotate_landscape_ = enabled; }
    void SetMaxDimension(int max_dimension);
    void SetCompressionParams(const std::vector<int>& params) { compression_params_ = params; }

private:
    bool rotate_landscape_ = true;
    int max_dimension_ = DEFAULT_MAX_DIMENSION;
    std::vector<int> compression_params_;

    static constexpr int DEFAULT_MAX_DIMENSION = 2000;
    static constexpr double FONT_HEIGHT_RATIO = 0.031;
    static constexpr double PADDING_RATIO = 0.004;
    static constexpr double LINE_SPACING_RATIO = 0.28;
};

#endif // STAMP_RENDERER_HH
