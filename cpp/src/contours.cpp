#include "visnir/contours.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace VisNir {

int ContourSet::depth(size_t index) const {
    int levels = 0;
    int current = parent(index);
    while (current >= 0) {
        ++levels;
        current = parent(static_cast<size_t>(current));
    }
    return levels;
}

ContourSet findObjects(const cv::Mat& mask) {
    if (mask.empty() || mask.type() != CV_8UC1) {
        throw std::invalid_argument("findObjects: expected a non-empty 8-bit single-channel mask");
    }

    ContourSet set;
    // findContours modified its input before OpenCV 3.2; keep the caller's mask untouched
    cv::Mat scratch = mask.clone();
    cv::findContours(scratch, set.contours, set.hierarchy, cv::RETR_TREE, cv::CHAIN_APPROX_NONE);
    return set;
}

} // namespace VisNir
