#ifndef VISNIR_NIR_MAPPER_HPP
#define VISNIR_NIR_MAPPER_HPP

#include <opencv2/core.hpp>

namespace VisNir {

// Scale factors from VIS pixel space to NIR pixel space.
struct ConversionRatio {
    double x;   // applied to columns
    double y;   // applied to rows
};

/**
 * Fixed camera-pair constants. The VIS reference frame is 2454 wide by 2056 high;
 * nir_x/nir_y are the NIR extents matching that frame before the physical
 * conversion factor is applied.
 */
struct SensorGeometry {
    double vis_width = 2454.0;
    double vis_height = 2056.0;
    double nir_x = 606.0;
    double nir_y = 508.0;
    double conversion_x = 1.125;
    double conversion_y = 1.125;
    double rat = 1.0;
};

// Anchors name the side where zero padding is added; the opposite side is cropped.
enum class VerticalAnchor {
    TOP,     // rows added at the top: content moves down
    BOTTOM   // rows added at the bottom: content moves up
};

enum class HorizontalAnchor {
    LEFT,    // columns added on the left: content moves right
    RIGHT    // columns added on the right: content moves left
};

/**
 * Residual mount offset between the two cameras.
 * x counts rows and goes with the vertical anchor, y counts columns and goes
 * with the horizontal anchor. A non-zero offset n shifts by n - 1 pixels.
 */
struct PositionOffset {
    int x = 2;
    int y = 0;
    VerticalAnchor vertical = VerticalAnchor::BOTTOM;
    HorizontalAnchor horizontal = HorizontalAnchor::RIGHT;
};

struct NirMappingConfig {
    int dilate_radius = 1;
    int dilate_iterations = 1;
    SensorGeometry sensors;
    PositionOffset position;
};

// Pixels removed before (top/left) and after (bottom/right) along one axis.
struct CropMargins {
    int leading;
    int trailing;
};

ConversionRatio conversionRatio(const SensorGeometry& sensors);

/**
 * Maps a plant mask from VIS pixel space onto a NIR frame:
 * dilate, resize by the conversion ratio, re-threshold, crop both sides of
 * each axis equally, then shift by the fixed mount offset.
 */
class NirMaskMapper {
public:
    explicit NirMaskMapper(const NirMappingConfig& config = NirMappingConfig());

    // Output has exactly nir_frame's size. Throws AlignmentError.
    cv::Mat map(const cv::Mat& vis_mask, const cv::Size& nir_frame) const;

    // Resize plus threshold 0 (light), so the result is binary again.
    cv::Mat scaleToNir(const cv::Mat& mask) const;

    const ConversionRatio& ratio() const { return ratio_; }
    const NirMappingConfig& config() const { return config_; }

    // Odd differences give the extra pixel to the trailing edge.
    static CropMargins cropMargins(int source_dim, int target_dim, const char* axis);
    static cv::Mat cropSidesEqually(const cv::Mat& mask, const cv::Size& target);
    static cv::Mat positionMask(const cv::Mat& mask, const cv::Size& target, const PositionOffset& offset);

private:
    NirMappingConfig config_;
    ConversionRatio ratio_;
};

} // namespace VisNir

#endif // VISNIR_NIR_MAPPER_HPP
