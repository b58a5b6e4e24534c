#ifndef VISNIR_ROI_HPP
#define VISNIR_ROI_HPP

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace VisNir {

/**
 * Signed offsets applied to an image's default frame rectangle.
 *
 * The default rectangle spans (0, 0) to (width - 5, height - 5). x_adj and y_adj
 * place the top-left corner; w_adj and h_adj move the right and bottom edges
 * relative to the default rectangle's right and bottom edges.
 */
struct RoiAdjustment {
    int x_adj = 0;
    int y_adj = 0;
    int w_adj = 0;
    int h_adj = 0;
};

enum class Containment {
    INSIDE,
    ON_EDGE,
    OUTSIDE
};

class Roi {
public:
    static constexpr int DEFAULT_FRAME_INSET = 5;

    // Throws RoiError if the rectangle is degenerate or leaves the frame.
    static Roi fromAdjustment(const cv::Size& frame, const RoiAdjustment& adjustment,
                              const std::string& name = "roi");
    static Roi fromRect(const cv::Size& frame, const cv::Rect& rect, const std::string& name = "roi");

    const cv::Rect& rect() const { return rect_; }
    const std::string& name() const { return name_; }

    // Closed boundary polygon, clockwise from the top-left corner.
    const std::vector<cv::Point>& polygon() const { return polygon_; }

    Containment test(const cv::Point& point) const;

    // Every vertex strictly inside. An empty contour is never fully inside.
    bool containsAll(const std::vector<cv::Point>& contour) const;

    // At least one vertex inside or on the boundary.
    bool overlaps(const std::vector<cv::Point>& contour) const;

private:
    Roi(const cv::Rect& rect, const std::string& name);

    cv::Rect rect_;
    std::string name_;
    std::vector<cv::Point> polygon_;
};

} // namespace VisNir

#endif // VISNIR_ROI_HPP
