#include "visnir/object_composition.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>

namespace VisNir {

RoiObjects selectRoiObjects(const cv::Mat& mask, const ContourSet& objects, const Roi& roi) {
    cv::Mat keep = cv::Mat::zeros(mask.size(), CV_8UC1);

    for (size_t i = 0; i < objects.size(); ++i) {
        if (objects.isHole(i)) continue;
        if (roi.overlaps(objects.contours[i])) {
            cv::drawContours(keep, objects.contours, static_cast<int>(i), cv::Scalar(255), cv::FILLED, cv::LINE_8);
        }
    }

    RoiObjects result;
    cv::bitwise_and(mask, keep, result.mask);
    result.area = cv::countNonZero(result.mask);
    result.objects = findObjects(result.mask);
    return result;
}

PlantRegion composeObjects(const cv::Size& frame, const ContourSet& objects) {
    if (objects.empty()) {
        throw std::invalid_argument("composeObjects: no contours to compose");
    }

    PlantRegion region;
    for (size_t i = 0; i < objects.size(); ++i) {
        bool innermost_hole = objects.firstChild(i) == -1 && objects.parent(i) > -1;
        if (innermost_hole) continue;
        region.contour.insert(region.contour.end(), objects.contours[i].begin(), objects.contours[i].end());
    }

    region.mask = cv::Mat::zeros(frame, CV_8UC1);
    cv::drawContours(region.mask, objects.contours, -1, cv::Scalar(255), cv::FILLED, cv::LINE_8, objects.hierarchy);
    return region;
}

} // namespace VisNir
