#include "visnir/nir_mapper.hpp"
#include "visnir/errors.hpp"
#include "visnir/mask_ops.hpp"
#include <sstream>

namespace VisNir {

ConversionRatio conversionRatio(const SensorGeometry& sensors) {
    ConversionRatio ratio;
    ratio.x = (sensors.nir_x / sensors.vis_width) * (sensors.conversion_x * sensors.rat);
    ratio.y = (sensors.nir_y / sensors.vis_height) * (sensors.conversion_y * sensors.rat);
    return ratio;
}

NirMaskMapper::NirMaskMapper(const NirMappingConfig& config)
    : config_(config), ratio_(conversionRatio(config.sensors)) {}

cv::Mat NirMaskMapper::map(const cv::Mat& vis_mask, const cv::Size& nir_frame) const {
    cv::Mat dilated = MaskOps::dilate(vis_mask, config_.dilate_radius, config_.dilate_iterations);
    cv::Mat scaled = scaleToNir(dilated);
    cv::Mat cropped = cropSidesEqually(scaled, nir_frame);
    return positionMask(cropped, nir_frame, config_.position);
}

cv::Mat NirMaskMapper::scaleToNir(const cv::Mat& mask) const {
    cv::Mat resized = MaskOps::resize(mask, ratio_.x, ratio_.y);
    return MaskOps::binaryThreshold(resized, 0, MaskOps::ObjectType::LIGHT);
}

CropMargins NirMaskMapper::cropMargins(int source_dim, int target_dim, const char* axis) {
    int difference = source_dim - target_dim;
    if (difference < 0) {
        std::ostringstream msg;
        msg << "Resized mask " << axis << " extent " << source_dim
            << " is smaller than the NIR frame extent " << target_dim;
        throw AlignmentError(msg.str());
    }

    CropMargins margins;
    margins.leading = difference / 2;
    margins.trailing = difference - margins.leading;
    return margins;
}

cv::Mat NirMaskMapper::cropSidesEqually(const cv::Mat& mask, const cv::Size& target) {
    CropMargins x = cropMargins(mask.cols, target.width, "width");
    CropMargins y = cropMargins(mask.rows, target.height, "height");

    cv::Rect keep(x.leading, y.leading, mask.cols - x.leading - x.trailing, mask.rows - y.leading - y.trailing);
    return mask(keep).clone();
}

cv::Mat NirMaskMapper::positionMask(const cv::Mat& mask, const cv::Size& target, const PositionOffset& offset) {
    const int rows = offset.x > 0 ? offset.x - 1 : 0;
    const int cols = offset.y > 0 ? offset.y - 1 : 0;
    int dy = (offset.vertical == VerticalAnchor::TOP) ? rows : -rows;
    int dx = (offset.horizontal == HorizontalAnchor::LEFT) ? cols : -cols;

    cv::Mat positioned = cv::Mat::zeros(target, mask.type());

    cv::Rect shifted(dx, dy, mask.cols, mask.rows);
    cv::Rect visible = shifted & cv::Rect(0, 0, target.width, target.height);
    if (visible.area() > 0) {
        mask(visible - cv::Point(dx, dy)).copyTo(positioned(visible));
    }
    return positioned;
}

} // namespace VisNir
