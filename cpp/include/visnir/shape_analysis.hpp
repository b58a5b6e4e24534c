#ifndef VISNIR_SHAPE_ANALYSIS_HPP
#define VISNIR_SHAPE_ANALYSIS_HPP

#include "visnir/contours.hpp"
#include "visnir/result_writer.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace VisNir {
namespace Shape {

struct ShapeMetrics {
    // Size measurements
    double area = 0.0;
    double hull_area = 0.0;
    double solidity = 0.0;
    double perimeter = 0.0;
    int width = 0;
    int height = 0;
    cv::Point2d center_of_mass;

    // Shape descriptors
    int hull_vertices = 0;
    bool in_bounds = true;   // false if the object touches the frame edge

    // Fitted ellipse, zero when the contour has fewer than 5 vertices
    cv::Point2f ellipse_center;
    double ellipse_major_axis = 0.0;
    double ellipse_minor_axis = 0.0;
    double ellipse_angle = 0.0;
    double ellipse_eccentricity = 0.0;
};

class ShapeAnalyzer {
public:
    ShapeAnalyzer();
    ~ShapeAnalyzer();

    // Mask gives area and centre of mass; the combined contour gives everything else.
    ShapeMetrics analyzeShape(const cv::Mat& mask, const Contour& contour);

    // Header/data rows; image_path, when not empty, adds an IMAGE row.
    MetricBlock toBlock(const ShapeMetrics& metrics, const std::string& image_path = "") const;

    // Contour, hull and centre of mass drawn over a copy of the image.
    cv::Mat drawShapes(const cv::Mat& image, const Contour& contour, const ShapeMetrics& metrics) const;

    double calculateSolidity(double area, const Contour& hull);
    double calculateEccentricity(const cv::RotatedRect& ellipse);

private:
    bool touchesBorder(const Contour& contour, const cv::Size& frame) const;
};

} // namespace Shape
} // namespace VisNir

#endif // VISNIR_SHAPE_ANALYSIS_HPP
