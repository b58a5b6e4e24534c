#include "visnir/shape_analysis.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace VisNir::Shape;

ShapeAnalyzer::ShapeAnalyzer() {
}

ShapeAnalyzer::~ShapeAnalyzer() {
}

ShapeMetrics ShapeAnalyzer::analyzeShape(const cv::Mat& mask, const VisNir::Contour& contour) {
    ShapeMetrics metrics;

    if (mask.empty() || contour.empty()) {
        std::cerr << "ShapeAnalyzer: Empty mask or contour" << std::endl;
        return metrics;
    }

    // === SIZE ===
    cv::Moments moments = cv::moments(mask, true);
    metrics.area = moments.m00;
    if (moments.m00 > 0) {
        metrics.center_of_mass = cv::Point2d(moments.m10 / moments.m00, moments.m01 / moments.m00);
    }

    VisNir::Contour hull;
    cv::convexHull(contour, hull);
    metrics.hull_area = cv::contourArea(hull);
    metrics.hull_vertices = static_cast<int>(hull.size());
    metrics.solidity = calculateSolidity(metrics.area, hull);
    metrics.perimeter = cv::arcLength(contour, true);

    cv::Rect bounds = cv::boundingRect(contour);
    metrics.width = bounds.width;
    metrics.height = bounds.height;
    metrics.in_bounds = !touchesBorder(contour, mask.size());

    // === ELLIPSE ===
    if (contour.size() >= 5) {
        cv::RotatedRect ellipse = cv::fitEllipse(contour);
        metrics.ellipse_center = ellipse.center;
        metrics.ellipse_major_axis = std::max(ellipse.size.width, ellipse.size.height);
        metrics.ellipse_minor_axis = std::min(ellipse.size.width, ellipse.size.height);
        metrics.ellipse_angle = ellipse.angle;
        metrics.ellipse_eccentricity = calculateEccentricity(ellipse);
    }

    return metrics;
}

VisNir::MetricBlock ShapeAnalyzer::toBlock(const ShapeMetrics& metrics, const std::string& image_path) const {
    using VisNir::ResultWriter;

    VisNir::MetricBlock block;
    block.header = {
        "HEADER_SHAPES", "area", "hull-area", "solidity", "perimeter", "width", "height",
        "center-of-mass-x", "center-of-mass-y", "hull_vertices", "in_bounds",
        "ellipse_center_x", "ellipse_center_y", "ellipse_major_axis", "ellipse_minor_axis",
        "ellipse_angle", "ellipse_eccentricity"
    };
    block.data = {
        "SHAPES_DATA",
        ResultWriter::formatNumber(metrics.area),
        ResultWriter::formatNumber(metrics.hull_area),
        ResultWriter::formatNumber(metrics.solidity),
        ResultWriter::formatNumber(metrics.perimeter),
        std::to_string(metrics.width),
        std::to_string(metrics.height),
        ResultWriter::formatNumber(metrics.center_of_mass.x),
        ResultWriter::formatNumber(metrics.center_of_mass.y),
        std::to_string(metrics.hull_vertices),
        metrics.in_bounds ? "True" : "False",
        ResultWriter::formatNumber(metrics.ellipse_center.x),
        ResultWriter::formatNumber(metrics.ellipse_center.y),
        ResultWriter::formatNumber(metrics.ellipse_major_axis),
        ResultWriter::formatNumber(metrics.ellipse_minor_axis),
        ResultWriter::formatNumber(metrics.ellipse_angle),
        ResultWriter::formatNumber(metrics.ellipse_eccentricity)
    };
    if (!image_path.empty()) {
        block.image_rows.push_back({"IMAGE", "shapes", image_path});
    }
    return block;
}

cv::Mat ShapeAnalyzer::drawShapes(const cv::Mat& image, const VisNir::Contour& contour, const ShapeMetrics& metrics) const {
    cv::Mat canvas;
    if (image.channels() == 1) {
        cv::cvtColor(image, canvas, cv::COLOR_GRAY2BGR);
    } else {
        canvas = image.clone();
    }

    VisNir::Contour hull;
    cv::convexHull(contour, hull);
    std::vector<VisNir::Contour> outlines = {contour, hull};
    cv::drawContours(canvas, outlines, 0, cv::Scalar(0, 255, 0), 2);
    cv::drawContours(canvas, outlines, 1, cv::Scalar(255, 0, 255), 2);
    cv::circle(canvas, cv::Point(cvRound(metrics.center_of_mass.x), cvRound(metrics.center_of_mass.y)),
               5, cv::Scalar(255, 0, 0), cv::FILLED);
    return canvas;
}

double ShapeAnalyzer::calculateSolidity(double area, const VisNir::Contour& hull) {
    double hull_area = cv::contourArea(hull);
    return (hull_area > 0) ? (area / hull_area) : 0.0;
}

double ShapeAnalyzer::calculateEccentricity(const cv::RotatedRect& ellipse) {
    double a = std::max(ellipse.size.width, ellipse.size.height) / 2.0;  // semi-major axis
    double b = std::min(ellipse.size.width, ellipse.size.height) / 2.0;  // semi-minor axis

    if (a == 0) return 0.0;

    return std::sqrt(1.0 - (b * b) / (a * a));
}

bool ShapeAnalyzer::touchesBorder(const VisNir::Contour& contour, const cv::Size& frame) const {
    return std::any_of(contour.begin(), contour.end(), [&frame](const cv::Point& p) {
        return p.x <= 0 || p.y <= 0 || p.x >= frame.width - 1 || p.y >= frame.height - 1;
    });
}
