#ifndef VISNIR_ROI_SUPPRESSION_HPP
#define VISNIR_ROI_SUPPRESSION_HPP

#include "visnir/contours.hpp"
#include "visnir/roi.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace VisNir {

/**
 * Erase every object contour whose vertices all lie strictly inside the ROI.
 *
 * A contour touching or crossing the ROI boundary is kept. Erasing fills the
 * whole region enclosed by the contour (nested holes and islands included) with 0.
 * Hole contours are never filled on their own: a hole is background already and
 * filling its boundary would eat into the enclosing object.
 *
 * Works on a copy; the input mask is not modified. If removed is given it
 * receives the indices of the erased contours.
 */
cv::Mat removeContoursInRoi(const cv::Mat& mask, const ContourSet& objects, const Roi& roi,
                            std::vector<size_t>* removed = nullptr);

} // namespace VisNir

#endif // VISNIR_ROI_SUPPRESSION_HPP
