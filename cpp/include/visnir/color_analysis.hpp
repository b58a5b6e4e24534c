#ifndef VISNIR_COLOR_ANALYSIS_HPP
#define VISNIR_COLOR_ANALYSIS_HPP

#include "visnir/result_writer.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <utility>
#include <vector>

namespace VisNir {
namespace ColorAnalysis {

using ChannelHistogram = std::pair<std::string, std::vector<double>>;

struct ColorMetrics {
    int bins = 0;
    std::vector<double> bin_values;

    // blue, green, red, lightness, green-magenta, blue-yellow, hue, saturation, value
    std::vector<ChannelHistogram> histograms;

    cv::Scalar mean_bgr;
    cv::Scalar mean_lab;
    cv::Scalar mean_hsv;
    int pixel_count = 0;
};

struct NirMetrics {
    int bins = 0;
    std::vector<double> bin_values;
    std::vector<double> histogram;
    double mean_intensity = 0.0;
    int pixel_count = 0;
};

class ColorAnalyzer {
public:
    explicit ColorAnalyzer(int bins = 256);
    ~ColorAnalyzer();

    // Per-channel histograms of the masked pixels in BGR, LAB and HSV.
    ColorMetrics analyzeColor(const cv::Mat& image, const cv::Mat& mask);

    // Histogram of the masked NIR signal (gray image).
    NirMetrics analyzeNirIntensity(const cv::Mat& nir_gray, const cv::Mat& mask);

    MetricBlock toBlock(const ColorMetrics& metrics) const;
    MetricBlock toBlock(const NirMetrics& metrics) const;

private:
    int bins_;

    std::vector<double> channelHistogram(const cv::Mat& channel, const cv::Mat& mask) const;
    std::vector<double> binValues() const;
};

} // namespace ColorAnalysis
} // namespace VisNir

#endif // VISNIR_COLOR_ANALYSIS_HPP
