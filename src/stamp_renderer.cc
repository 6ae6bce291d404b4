#include "stamp_renderer.hh"
#include "error_handler.hh"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

OpenCvStampRenderer::OpenCvStampRenderer() {
    compression_params_ = {cv::IMWRITE_PNG_COMPRESSION, 6};
}

OpenCvStampRenderer::~OpenCvStampRenderer() {}

void OpenCvStampRenderer::SetMaxDimension(int max_dimension) {
    if (max_dimension <= 0) {
        throw std::invalid_argument("Max dimension must be positive");
    }
    max_dimension_ = max_dimension;
}

// --- PUBLIC METHODS ---

bool OpenCvStampRenderer::Render(const PhotoRef& photo, const std::string& formatted_timestamp,
                                 const std::string& location) {
    cv::Mat image;
    try {
        image = cv::imread(photo.path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        LOG_EXCEPTION(e, "Renderer", photo.path);
        return false;
    }
    if (image.empty()) {
        LOG_ERROR("Renderer", "Failed to load image: " + photo.path);
        return false;
    }

    std::vector<std::string> lines = {formatted_timestamp};
    for (const auto& line : SplitLines(location)) {
        lines.push_back(line);
    }

    std::string output_path = OutputPathFor(photo.path);
    bool success = false;
    try {
        cv::Mat stamped = Compose(image, lines);
        success = cv::imwrite(output_path, stamped, compression_params_);
    } catch (const cv::Exception& e) {
        LOG_EXCEPTION(e, "Renderer", output_path);
        return false;
    }

    if (!success) {
        LOG_ERROR("Renderer", "Failed to write stamped image: " + output_path);
        return false;
    }
    LOG_INFO("Renderer", "Saved stamped image: " + output_path);
    return true;
}

cv::Mat OpenCvStampRenderer::Compose(const cv::Mat& image, const std::vector<std::string>& lines) const {
    cv::Mat canvas;
    if (rotate_landscape_ && image.cols > image.rows) {
        cv::rotate(image, canvas, cv::ROTATE_90_CLOCKWISE);
    } else {
        canvas = image.clone();
    }

    // Shrink to fit, never enlarge
    double scale = std::min({1.0,
                             static_cast<double>(max_dimension_) / canvas.cols,
                             static_cast<double>(max_dimension_) / canvas.rows});
    if (scale < 1.0) {
        cv::resize(canvas, canvas, cv::Size(), scale, scale, cv::INTER_AREA);
    }

    const int width = canvas.cols;
    const int height = canvas.rows;
    const int font_px = std::max(1, static_cast<int>(height * FONT_HEIGHT_RATIO));
    const int thickness = std::max(1, font_px / 12);
    const int font_face = cv::FONT_HERSHEY_SIMPLEX;
    const double font_scale = cv::getFontScaleFromHeight(font_face, font_px, thickness);
    const double padding_x = width * PADDING_RATIO;
    const double padding_y = height * PADDING_RATIO;

    double text_y = padding_y + font_px;
    for (const auto& line : lines) {
        int baseline = 0;
        cv::Size extents = cv::getTextSize(line, font_face, font_scale, thickness, &baseline);
        int text_x = static_cast<int>(width - extents.width - padding_x);
        cv::putText(canvas, line, cv::Point(std::max(0, text_x), static_cast<int>(text_y)),
                    font_face, font_scale, cv::Scalar(255, 255, 255), thickness, cv::LINE_AA);
        text_y += extents.height + font_px * LINE_SPACING_RATIO;
    }
    return canvas;
}

std::string OpenCvStampRenderer::OutputPathFor(const std::string& photo_path) {
    fs::path path(photo_path);
    fs::path output = path.parent_path() / (path.stem().string() + "_stamped.png");
    return output.string();
}

size_t OpenCvStampRenderer::CleanStampedOutputs(const std::string& root) {
    size_t removed = 0;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        LOG_WARNING("Renderer", "Nothing to clean, not a directory: " + root);
        return 0;
    }

    std::vector<fs::path> stale;
    for (const auto& entry : fs::recursive_directory_iterator(root, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        std::string name = entry.path().filename().string();
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name.find("_stamped") != std::string::npos) {
            stale.push_back(entry.path());
        }
    }

    for (const auto& path : stale) {
        if (fs::remove(path, ec)) {
            ++removed;
            LOG_INFO("Renderer", "Removed stamped image: " + path.string());
        } else {
            LOG_ERROR("Renderer", "Error removing file " + path.string() + ": " + ec.message());
        }
    }
    return removed;
}
