#ifndef IMAGE_DIFFERENCE_HH
#define IMAGE_DIFFERENCE_HH

#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

// Decode collaborator. Returns an empty Mat on failure; an exception from
// the codec is treated as a failure of that photo.
class ImageDecoder {
public:
    virtual ~ImageDecoder() = default;
    virtual cv::Mat Decode(const std::string& path) const = 0;
};

class OpenCvImageDecoder : public ImageDecoder {
public:
    cv::Mat Decode(const std::string& path) const override;
};

struct DistanceResult {
    std::vector<double> scores;              // one per consecutive pair
    std::vector<std::string> failed_paths;   // in input order, each listed once
};

// Visual distance between photos: both images are resampled to a small
// common size and compared channel by channel. Result is in [0, 1],
// 0 for identical content.
class ImageDifferenceEstimator {
public:
    explicit ImageDifferenceEstimator(const ImageDecoder& decoder);
    ~ImageDifferenceEstimator();

    double Distance(const std::string& path_a, const std::string& path_b) const;
    double Distance(const cv::Mat& a, const cv::Mat& b) const;

    // Scores for every consecutive pair of the sequence. Decoding may be
    // spread over worker threads; results stay in index order.
    DistanceResult ComputeSequence(const std::vector<std::string>& paths) const;

    void SetDefaultDistance(double distance);
    void SetWorkerCount(unsigned int workers);
    double GetDefaultDistance() const { return default_distance_; }

private:
    // Decode and normalize; empty on any decoder failure, never throws
    cv::Mat DecodeThumbnail(const std::string& path) const;
    // Normalized thumbnail, empty if the input is empty
    cv::Mat Normalize(const cv::Mat& image) const;
    double CompareNormalized(const cv::Mat& a, const cv::Mat& b) const;

    const ImageDecoder& decoder_;
    double default_distance_;
    unsigned int workers_;

    static constexpr int COMPARE_SIZE = 64;
    static constexpr double DEFAULT_DISTANCE = 0.5;
};

#endif // IMAGE_DIFFERENCE_HH
