#pragma once

#include "slide_ingest/core/types.hpp"
#include <opencv2/objdetect.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace slide_ingest::image {

// Frames larger than this on either axis are never searched for faces
constexpr int kMaxFaceDetectionSide = 8000;

/**
 * Haar cascade face finder. The cascade is loaded once at construction;
 * when it cannot be loaded available() is false and detect() returns
 * nothing, so callers branch on the flag instead of on errors.
 */
class FaceDetector {
public:
    FaceDetector() = default;
    explicit FaceDetector(const std::string& cascade_path);

    bool available() const { return available_; }

    // BGR or grayscale 8-bit input. OpenCV failures are logged and yield {}.
    std::vector<cv::Rect> detect(const cv::Mat& img);

private:
    cv::CascadeClassifier cascade_;
    std::mutex mutex_;
    bool available_ = false;
};

} // namespace slide_ingest::image
