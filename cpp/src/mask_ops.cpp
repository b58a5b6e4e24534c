#include "visnir/mask_ops.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace VisNir {
namespace MaskOps {

namespace {

void requireSingleChannel(const cv::Mat& mask, const char* op) {
    if (mask.empty() || mask.channels() != 1) {
        throw std::invalid_argument(std::string(op) + ": expected a non-empty single-channel image");
    }
}

int channelIndex(ColorSpace space, char channel) {
    switch (space) {
        case ColorSpace::LAB:
            if (channel == 'l') return 0;
            if (channel == 'a') return 1;
            if (channel == 'b') return 2;
            break;
        case ColorSpace::HSV:
            if (channel == 'h') return 0;
            if (channel == 's') return 1;
            if (channel == 'v') return 2;
            break;
        case ColorSpace::GRAY:
            return 0;
    }
    throw std::invalid_argument(std::string("toGrayscale: unknown channel '") + channel + "'");
}

} // namespace

cv::Mat toGrayscale(const cv::Mat& image, ColorSpace space, char channel) {
    if (image.empty()) {
        throw std::invalid_argument("toGrayscale: empty image");
    }
    if (image.channels() == 1) {
        return image.clone();
    }

    if (space == ColorSpace::GRAY) {
        cv::Mat gray;
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        return gray;
    }

    int index = channelIndex(space, channel);
    cv::Mat converted;
    cv::cvtColor(image, converted, space == ColorSpace::LAB ? cv::COLOR_BGR2Lab : cv::COLOR_BGR2HSV);

    cv::Mat out;
    cv::extractChannel(converted, out, index);
    return out;
}

cv::Mat binaryThreshold(const cv::Mat& gray, int threshold, ObjectType type, int max_value) {
    requireSingleChannel(gray, "binaryThreshold");

    cv::Mat mask;
    int mode = (type == ObjectType::LIGHT) ? cv::THRESH_BINARY : cv::THRESH_BINARY_INV;
    cv::threshold(gray, mask, threshold, max_value, mode);
    if (mask.type() != CV_8UC1) {
        mask.convertTo(mask, CV_8UC1);
    }
    return mask;
}

cv::Mat gaussianBlur(const cv::Mat& image, int ksize) {
    cv::Mat out;
    cv::GaussianBlur(image, out, cv::Size(ksize, ksize), 0, 0);
    return out;
}

cv::Mat medianBlur(const cv::Mat& image, int ksize) {
    cv::Mat out;
    cv::medianBlur(image, out, ksize);
    return out;
}

cv::Mat logicalOr(const cv::Mat& mask1, const cv::Mat& mask2) {
    requireSingleChannel(mask1, "logicalOr");
    requireSingleChannel(mask2, "logicalOr");
    if (mask1.size() != mask2.size()) {
        throw std::invalid_argument("logicalOr: masks differ in size");
    }

    cv::Mat merged;
    cv::bitwise_or(mask1, mask2, merged);
    return merged;
}

cv::Mat fillSmallObjects(const cv::Mat& mask, int min_area) {
    requireSingleChannel(mask, "fillSmallObjects");

    cv::Mat labels, stats, centroids;
    int count = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);

    // Label 0 is the background
    std::vector<uchar> keep(count, 0);
    for (int label = 1; label < count; ++label) {
        keep[label] = stats.at<int>(label, cv::CC_STAT_AREA) >= min_area ? 1 : 0;
    }

    cv::Mat filled = mask.clone();
    for (int y = 0; y < labels.rows; ++y) {
        const int* label_row = labels.ptr<int>(y);
        uchar* out_row = filled.ptr<uchar>(y);
        for (int x = 0; x < labels.cols; ++x) {
            if (label_row[x] > 0 && !keep[label_row[x]]) {
                out_row[x] = 0;
            }
        }
    }
    return filled;
}

cv::Mat dilate(const cv::Mat& mask, int radius, int iterations) {
    requireSingleChannel(mask, "dilate");

    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(2 * radius + 1, 2 * radius + 1));
    cv::Mat out;
    cv::dilate(mask, out, kernel, cv::Point(-1, -1), iterations);
    return out;
}

cv::Mat resize(const cv::Mat& image, double scale_x, double scale_y) {
    if (scale_x <= 0.0 || scale_y <= 0.0) {
        throw std::invalid_argument("resize: scale factors must be positive");
    }
    cv::Mat out;
    cv::resize(image, out, cv::Size(), scale_x, scale_y, cv::INTER_LINEAR);
    return out;
}

cv::Mat extractRegion(const cv::Mat& mask, const cv::Rect& region) {
    if ((region & cv::Rect(0, 0, mask.cols, mask.rows)) != region) {
        throw std::out_of_range("extractRegion: region outside image");
    }
    return mask(region).clone();
}

cv::Mat replaceRegion(const cv::Mat& mask, const cv::Rect& region, const cv::Mat& patch) {
    if ((region & cv::Rect(0, 0, mask.cols, mask.rows)) != region) {
        throw std::out_of_range("replaceRegion: region outside image");
    }
    if (patch.size() != region.size() || patch.type() != mask.type()) {
        throw std::invalid_argument("replaceRegion: patch does not match region");
    }

    cv::Mat out = mask.clone();
    patch.copyTo(out(region));
    return out;
}

bool isBinary(const cv::Mat& mask) {
    if (mask.empty() || mask.type() != CV_8UC1) return false;

    for (int y = 0; y < mask.rows; ++y) {
        const uchar* row = mask.ptr<uchar>(y);
        for (int x = 0; x < mask.cols; ++x) {
            if (row[x] != 0 && row[x] != 255) return false;
        }
    }
    return true;
}

} // namespace MaskOps
} // namespace VisNir
