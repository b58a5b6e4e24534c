#ifndef VISNIR_OBJECT_COMPOSITION_HPP
#define VISNIR_OBJECT_COMPOSITION_HPP

#include "visnir/contours.hpp"
#include "visnir/roi.hpp"
#include <opencv2/core.hpp>

namespace VisNir {

struct RoiObjects {
    ContourSet objects;
    cv::Mat mask;
    int area = 0;
};

// The plant: all kept contours merged into one vertex set and one mask.
struct PlantRegion {
    Contour contour;
    cv::Mat mask;
};

/**
 * Keep the objects that partially or fully overlap the ROI.
 * Holes of kept objects stay holes; contours are re-extracted from the kept mask.
 */
RoiObjects selectRoiObjects(const cv::Mat& mask, const ContourSet& objects, const Roi& roi);

/**
 * Merge contours into one PlantRegion of the given frame size.
 * The combined contour skips innermost holes; the mask is filled even-odd so
 * holes are preserved. Throws std::invalid_argument for an empty set; callers
 * check for the no-plant case first.
 */
PlantRegion composeObjects(const cv::Size& frame, const ContourSet& objects);

} // namespace VisNir

#endif // VISNIR_OBJECT_COMPOSITION_HPP
