#include "slide_ingest/image/face_detector.hpp"
#include "slide_ingest/core/utils.hpp"

#include <opencv2/imgproc.hpp>
#include <system_error>

namespace slide_ingest::image {

FaceDetector::FaceDetector(const std::string& cascade_path) {
    if (cascade_path.empty()) {
        core::log_line("ENHANCE", "Face cascade not configured, face-aware softening disabled");
        return;
    }

    std::error_code ec;
    if (!fs::exists(cascade_path, ec)) {
        core::log_line("ENHANCE", "Face cascade not found: " + cascade_path);
        return;
    }

    try {
        available_ = cascade_.load(cascade_path);
    } catch (const cv::Exception& e) {
        core::log_line("ENHANCE", std::string("Cannot load face cascade: ") + e.what());
        available_ = false;
    }
    if (!available_) {
        core::log_line("ENHANCE", "Face cascade unusable: " + cascade_path);
    }
}

std::vector<cv::Rect> FaceDetector::detect(const cv::Mat& img) {
    std::vector<cv::Rect> faces;
    if (!available_ || img.empty()) return faces;

    if (img.cols > kMaxFaceDetectionSide || img.rows > kMaxFaceDetectionSide) {
        core::log_line("ENHANCE", "Image too large for face detection: " +
                                      std::to_string(img.cols) + "x" + std::to_string(img.rows));
        return faces;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        cv::Mat gray;
        if (img.channels() == 1) {
            gray = img;
        } else {
            cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);
        }
        cascade_.detectMultiScale(gray, faces, 1.1, 5, 0, cv::Size(30, 30));
    } catch (const cv::Exception& e) {
        core::log_line("ENHANCE", std::string("OpenCV face detection error: ") + e.what());
        faces.clear();
    }
    return faces;
}

} // namespace slide_ingest::image
