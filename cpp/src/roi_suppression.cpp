#include "visnir/roi_suppression.hpp"
#include <opencv2/imgproc.hpp>

namespace VisNir {

cv::Mat removeContoursInRoi(const cv::Mat& mask, const ContourSet& objects, const Roi& roi,
                            std::vector<size_t>* removed) {
    cv::Mat clean_mask = mask.clone();
    if (removed) removed->clear();

    for (size_t i = 0; i < objects.size(); ++i) {
        if (objects.isHole(i)) continue;
        if (!roi.containsAll(objects.contours[i])) continue;

        cv::drawContours(clean_mask, objects.contours, static_cast<int>(i), cv::Scalar(0), cv::FILLED, cv::LINE_8);
        if (removed) removed->push_back(i);
    }

    return clean_mask;
}

} // namespace VisNir
