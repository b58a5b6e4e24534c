#ifndef VISNIR_CONTOURS_HPP
#define VISNIR_CONTOURS_HPP

#include <opencv2/core.hpp>
#include <vector>

namespace VisNir {

using Contour = std::vector<cv::Point>;

/**
 * Contours of a binary mask with their nesting tree.
 * hierarchy[i] = {next, previous, first_child, parent}, -1 where absent,
 * indexed in lock step with contours.
 */
struct ContourSet {
    std::vector<Contour> contours;
    std::vector<cv::Vec4i> hierarchy;

    bool empty() const { return contours.empty(); }
    size_t size() const { return contours.size(); }

    int parent(size_t index) const { return hierarchy[index][3]; }
    int firstChild(size_t index) const { return hierarchy[index][2]; }

    // Number of ancestors. Even depths are object boundaries, odd depths are holes.
    int depth(size_t index) const;
    bool isHole(size_t index) const { return depth(index) % 2 == 1; }
};

// Every boundary of the mask, unapproximated, with the full tree (RETR_TREE).
ContourSet findObjects(const cv::Mat& mask);

} // namespace VisNir

#endif // VISNIR_CONTOURS_HPP
