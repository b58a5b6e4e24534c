#include "visnir/color_analysis.hpp"
#include <opencv2/imgproc.hpp>
#include <iostream>
#include <stdexcept>

using namespace VisNir::ColorAnalysis;

ColorAnalyzer::ColorAnalyzer(int bins) : bins_(bins) {
    if (bins_ <= 0 || bins_ > 256) {
        throw std::invalid_argument("ColorAnalyzer: bins must be in 1..256");
    }
}

ColorAnalyzer::~ColorAnalyzer() {
}

ColorMetrics ColorAnalyzer::analyzeColor(const cv::Mat& image, const cv::Mat& mask) {
    ColorMetrics metrics;
    metrics.bins = bins_;
    metrics.bin_values = binValues();

    if (image.empty() || image.channels() != 3) {
        throw std::invalid_argument("ColorAnalyzer: expected a BGR image");
    }

    metrics.pixel_count = cv::countNonZero(mask);
    if (metrics.pixel_count == 0) {
        std::cerr << "ColorAnalyzer: Empty mask, histograms are all zero" << std::endl;
    }

    cv::Mat lab, hsv;
    cv::cvtColor(image, lab, cv::COLOR_BGR2Lab);
    cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);

    metrics.mean_bgr = cv::mean(image, mask);
    metrics.mean_lab = cv::mean(lab, mask);
    metrics.mean_hsv = cv::mean(hsv, mask);

    std::vector<cv::Mat> bgr_channels, lab_channels, hsv_channels;
    cv::split(image, bgr_channels);
    cv::split(lab, lab_channels);
    cv::split(hsv, hsv_channels);

    metrics.histograms = {
        {"blue", channelHistogram(bgr_channels[0], mask)},
        {"green", channelHistogram(bgr_channels[1], mask)},
        {"red", channelHistogram(bgr_channels[2], mask)},
        {"lightness", channelHistogram(lab_channels[0], mask)},
        {"green-magenta", channelHistogram(lab_channels[1], mask)},
        {"blue-yellow", channelHistogram(lab_channels[2], mask)},
        {"hue", channelHistogram(hsv_channels[0], mask)},
        {"saturation", channelHistogram(hsv_channels[1], mask)},
        {"value", channelHistogram(hsv_channels[2], mask)}
    };

    return metrics;
}

NirMetrics ColorAnalyzer::analyzeNirIntensity(const cv::Mat& nir_gray, const cv::Mat& mask) {
    if (nir_gray.empty() || nir_gray.channels() != 1) {
        throw std::invalid_argument("ColorAnalyzer: expected a single-channel NIR image");
    }

    NirMetrics metrics;
    metrics.bins = bins_;
    metrics.bin_values = binValues();
    metrics.histogram = channelHistogram(nir_gray, mask);
    metrics.pixel_count = cv::countNonZero(mask);
    metrics.mean_intensity = cv::mean(nir_gray, mask)[0];
    return metrics;
}

VisNir::MetricBlock ColorAnalyzer::toBlock(const ColorMetrics& metrics) const {
    using VisNir::ResultWriter;

    VisNir::MetricBlock block;
    block.header = {"HEADER_HISTOGRAM", "bin-number", "bin-values"};
    block.data = {"HISTOGRAM_DATA", std::to_string(metrics.bins), ResultWriter::formatList(metrics.bin_values)};
    for (const auto& [name, histogram] : metrics.histograms) {
        block.header.push_back(name);
        block.data.push_back(ResultWriter::formatList(histogram));
    }
    return block;
}

VisNir::MetricBlock ColorAnalyzer::toBlock(const NirMetrics& metrics) const {
    using VisNir::ResultWriter;

    VisNir::MetricBlock block;
    block.header = {"HEADER_HISTOGRAM", "bin-number", "bin-values", "nir"};
    block.data = {
        "NIR_DATA",
        std::to_string(metrics.bins),
        ResultWriter::formatList(metrics.bin_values),
        ResultWriter::formatList(metrics.histogram)
    };
    return block;
}

std::vector<double> ColorAnalyzer::channelHistogram(const cv::Mat& channel, const cv::Mat& mask) const {
    cv::Mat hist;
    int hist_size = bins_;
    float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    cv::calcHist(&channel, 1, nullptr, mask, hist, 1, &hist_size, ranges, true, false);

    std::vector<double> values(bins_);
    for (int i = 0; i < bins_; ++i) {
        values[i] = hist.at<float>(i);
    }
    return values;
}

std::vector<double> ColorAnalyzer::binValues() const {
    std::vector<double> values(bins_);
    const double width = 256.0 / bins_;
    for (int i = 0; i < bins_; ++i) {
        values[i] = i * width;
    }
    return values;
}
