#include "image_difference.hh"
#include "error_handler.hh"
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

cv::Mat OpenCvImageDecoder::Decode(const std::string& path) const {
    try {
        return cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        LOG_EXCEPTION(e, "ImageDecoder", path);
        return cv::Mat();
    }
}

ImageDifferenceEstimator::ImageDifferenceEstimator(const ImageDecoder& decoder)
    : decoder_(decoder), default_distance_(DEFAULT_DISTANCE), workers_(1) {}

ImageDifferenceEstimator::~ImageDifferenceEstimator() {}

// --- PUBLIC METHODS ---

double ImageDifferenceEstimator::Distance(const std::string& path_a, const std::string& path_b) const {
    cv::Mat a = DecodeThumbnail(path_a);
    cv::Mat b = DecodeThumbnail(path_b);
    if (a.empty() || b.empty()) {
        return default_distance_;
    }
    return CompareNormalized(a, b);
}

double ImageDifferenceEstimator::Distance(const cv::Mat& a, const cv::Mat& b) const {
    cv::Mat norm_a = Normalize(a);
    cv::Mat norm_b = Normalize(b);
    if (norm_a.empty() || norm_b.empty()) {
        return default_distance_;
    }
    return CompareNormalized(norm_a, norm_b);
}

DistanceResult ImageDifferenceEstimator::ComputeSequence(const std::vector<std::string>& paths) const {
    DistanceResult result;
    if (paths.size() < 2) {
        return result;
    }

    const size_t n = paths.size();
    std::vector<cv::Mat> thumbnails(n);
    std::atomic<size_t> next_index{0};

    // Each image is decoded once and reused for both neighbouring pairs
    auto decode_worker = [&]() {
        for (size_t i = next_index.fetch_add(1); i < n; i = next_index.fetch_add(1)) {
            thumbnails[i] = DecodeThumbnail(paths[i]);
        }
    };

    unsigned int worker_count = std::min<unsigned int>(workers_, static_cast<unsigned int>(n));
    if (worker_count <= 1) {
        decode_worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(worker_count);
        for (unsigned int w = 0; w < worker_count; ++w) {
            threads.emplace_back(decode_worker);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    for (size_t i = 0; i < n; ++i) {
        if (thumbnails[i].empty()) {
            result.failed_paths.push_back(paths[i]);
        }
    }

    result.scores.reserve(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) {
        if (thumbnails[i].empty() || thumbnails[i + 1].empty()) {
            result.scores.push_back(default_distance_);
        } else {
            result.scores.push_back(CompareNormalized(thumbnails[i], thumbnails[i + 1]));
        }
    }
    return result;
}

void ImageDifferenceEstimator::SetDefaultDistance(double distance) {
    if (distance < 0.0) {
        throw std::invalid_argument("Default distance must be non-negative");
    }
    default_distance_ = distance;
}

void ImageDifferenceEstimator::SetWorkerCount(unsigned int workers) {
    workers_ = std::max(1u, workers);
}

// --- PRIVATE HELPER METHODS ---

cv::Mat ImageDifferenceEstimator::DecodeThumbnail(const std::string& path) const {
    cv::Mat thumbnail;
    try {
        thumbnail = Normalize(decoder_.Decode(path));
    } catch (const std::exception& e) {
        LOG_EXCEPTION(e, "ImageDifference", path);
        thumbnail = cv::Mat();
    }
    if (thumbnail.empty()) {
        LOG_WARNING("ImageDifference", "Could not decode " + path + ", using default distance");
    }
    return thumbnail;
}

cv::Mat ImageDifferenceEstimator::Normalize(const cv::Mat& image) const {
    if (image.empty()) {
        return cv::Mat();
    }

    cv::Mat eight_bit;
    if (image.depth() == CV_8U) {
        eight_bit = image;
    } else if (image.depth() == CV_16U) {
        image.convertTo(eight_bit, CV_8U, 1.0 / 256.0);
    } else {
        image.convertTo(eight_bit, CV_8U);
    }

    cv::Mat bgr;
    switch (eight_bit.channels()) {
        case 1:  cv::cvtColor(eight_bit, bgr, cv::COLOR_GRAY2BGR); break;
        case 4:  cv::cvtColor(eight_bit, bgr, cv::COLOR_BGRA2BGR); break;
        case 3:  bgr = eight_bit; break;
        default: return cv::Mat();
    }

    cv::Mat thumbnail;
    cv::resize(bgr, thumbnail, cv::Size(COMPARE_SIZE, COMPARE_SIZE), 0, 0, cv::INTER_AREA);
    return thumbnail;
}

double ImageDifferenceEstimator::CompareNormalized(const cv::Mat& a, const cv::Mat& b) const {
    cv::Mat diff;
    cv::absdiff(a, b, diff);
    cv::Scalar channel_sums = cv::sum(diff);
    double diff_sum = channel_sums[0] + channel_sums[1] + channel_sums[2];
    double max_diff = static_cast<double>(a.total()) * 3.0 * 255.0;
    return diff_sum / max_diff;
}
