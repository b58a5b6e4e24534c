#ifndef VISNIR_MASK_OPS_HPP
#define VISNIR_MASK_OPS_HPP

#include <opencv2/core.hpp>

namespace VisNir {
namespace MaskOps {

enum class ObjectType {
    LIGHT,  // keep pixels brighter than the threshold
    DARK    // keep pixels darker than the threshold
};

enum class ColorSpace {
    GRAY,
    LAB,
    HSV
};

/**
 * Extract one 8-bit channel from a BGR image.
 * channel is 'l', 'a', 'b' for LAB and 'h', 's', 'v' for HSV; ignored for GRAY.
 * Single-channel input is returned as a copy.
 */
cv::Mat toGrayscale(const cv::Mat& image, ColorSpace space, char channel);

// 255 where the pixel satisfies the comparison, 0 elsewhere. Never aliases the input.
cv::Mat binaryThreshold(const cv::Mat& gray, int threshold, ObjectType type, int max_value = 255);

cv::Mat gaussianBlur(const cv::Mat& image, int ksize = 7);
cv::Mat medianBlur(const cv::Mat& image, int ksize = 7);

// Pixelwise OR of two masks with identical size.
cv::Mat logicalOr(const cv::Mat& mask1, const cv::Mat& mask2);

// Blacken 8-connected foreground components smaller than min_area pixels.
cv::Mat fillSmallObjects(const cv::Mat& mask, int min_area = 100);

// Grow the foreground with a (2 * radius + 1) square structuring element.
cv::Mat dilate(const cv::Mat& mask, int radius = 1, int iterations = 1);

// Independent x/y scale with linear interpolation; re-threshold to get a mask back.
cv::Mat resize(const cv::Mat& image, double scale_x, double scale_y);

cv::Mat extractRegion(const cv::Mat& mask, const cv::Rect& region);

// Copy of mask with region overwritten by patch (patch.size() == region.size()).
cv::Mat replaceRegion(const cv::Mat& mask, const cv::Rect& region, const cv::Mat& patch);

bool isBinary(const cv::Mat& mask);

} // namespace MaskOps
} // namespace VisNir

#endif // VISNIR_MASK_OPS_HPP
