#include "visnir/roi.hpp"
#include "visnir/errors.hpp"
#include <opencv2/imgproc.hpp>
#include <sstream>

namespace VisNir {

Roi::Roi(const cv::Rect& rect, const std::string& name) : rect_(rect), name_(name) {
    const int right = rect_.x + rect_.width;
    const int bottom = rect_.y + rect_.height;
    polygon_ = {
        cv::Point(rect_.x, rect_.y),
        cv::Point(right, rect_.y),
        cv::Point(right, bottom),
        cv::Point(rect_.x, bottom)
    };
}

Roi Roi::fromAdjustment(const cv::Size& frame, const RoiAdjustment& adjustment, const std::string& name) {
    const int default_right = frame.width - DEFAULT_FRAME_INSET;
    const int default_bottom = frame.height - DEFAULT_FRAME_INSET;

    const int x = adjustment.x_adj;
    const int y = adjustment.y_adj;
    const int right = default_right + adjustment.w_adj;
    const int bottom = default_bottom + adjustment.h_adj;

    return fromRect(frame, cv::Rect(x, y, right - x, bottom - y), name);
}

Roi Roi::fromRect(const cv::Size& frame, const cv::Rect& rect, const std::string& name) {
    if (rect.width <= 0 || rect.height <= 0 || rect.x < 0 || rect.y < 0 ||
        rect.x + rect.width > frame.width || rect.y + rect.height > frame.height) {
        std::ostringstream msg;
        msg << "ROI '" << name << "' " << rect << " is invalid for a "
            << frame.width << "x" << frame.height << " frame";
        throw RoiError(msg.str());
    }
    return Roi(rect, name);
}

Containment Roi::test(const cv::Point& point) const {
    double result = cv::pointPolygonTest(polygon_, cv::Point2f(point), false);
    if (result > 0) return Containment::INSIDE;
    if (result == 0) return Containment::ON_EDGE;
    return Containment::OUTSIDE;
}

bool Roi::containsAll(const std::vector<cv::Point>& contour) const {
    if (contour.empty()) return false;

    for (const auto& vertex : contour) {
        if (test(vertex) != Containment::INSIDE) {
            return false;
        }
    }
    return true;
}

bool Roi::overlaps(const std::vector<cv::Point>& contour) const {
    for (const auto& vertex : contour) {
        if (test(vertex) != Containment::OUTSIDE) {
            return true;
        }
    }
    return false;
}

} // namespace VisNir
