#ifndef TEST_SUPPORT_HH
#define TEST_SUPPORT_HH

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <unistd.h>
#include <opencv2/opencv.hpp>
#include "image_difference.hh"
#include "stamp_renderer.hh"

namespace test_support {

// Serves pre-built images by path; unknown paths fail to decode
class FakeDecoder : public ImageDecoder {
public:
    void Add(const std::string& path, const cv::Mat& image) { images_[path] = image; }

    cv::Mat Decode(const std::string& path) const override {
        auto it = images_.find(path);
        return it == images_.end() ? cv::Mat() : it->second.clone();
    }

private:
    std::map<std::string, cv::Mat> images_;
};

struct RenderCall {
    std::string path;
    std::string timestamp;
    std::string location;
};

class RecordingRenderer : public StampRenderer {
public:
    bool Render(const PhotoRef& photo, const std::string& formatted_timestamp,
                const std::string& location) override {
        calls.push_back({photo.path, formatted_timestamp, location});
        if (photo.path == throw_on) {
            throw std::runtime_error("disk full");
        }
        return photo.path != fail_on;
    }

    std::vector<RenderCall> calls;
    std::string fail_on;
    std::string throw_on;
};

inline cv::Mat SolidImage(int width, int height, uchar value) {
    return cv::Mat(height, width, CV_8UC3, cv::Scalar(value, value, value));
}

// Scratch directory removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        path_ = std::filesystem::temp_directory_path() /
                ("photostamp_" + tag + "_" + std::to_string(getpid()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string Path() const { return path_.string(); }

    std::string Touch(const std::string& relative) const {
        std::filesystem::path file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream(file.string()) << "x";
        return file.string();
    }

private:
    std::filesystem::path path_;
};

} // namespace test_support

#endif // TEST_SUPPORT_HH
