#ifndef VISNIR_CABINET_PIPELINE_HPP
#define VISNIR_CABINET_PIPELINE_HPP

#include "visnir/color_analysis.hpp"
#include "visnir/config_manager.hpp"
#include "visnir/image_io.hpp"
#include "visnir/nir_mapper.hpp"
#include "visnir/object_composition.hpp"
#include "visnir/result_writer.hpp"
#include "visnir/shape_analysis.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace VisNir {

enum class PipelineStatus {
    NO_PLANT_FOUND,   // nothing survived ROI selection; no rows written
    VIS_ONLY,         // VIS rows written, NIR transfer failed
    COMPLETE
};

const char* statusName(PipelineStatus status);

struct VisSegmentation {
    cv::Mat green_channel;
    cv::Mat coarse_mask;
    cv::Mat refined_mask;
    std::optional<PlantRegion> plant;
};

struct NirTransfer {
    cv::Mat mask;                        // exactly the NIR frame size
    std::optional<PlantRegion> plant;    // empty if the mapped mask has no contours
};

struct OutputOptions {
    std::string result_path;
    std::string coresult_path;
    std::string output_dir;
    bool write_images = false;
};

struct PairResult {
    PipelineStatus status = PipelineStatus::NO_PLANT_FOUND;
    std::string vis_path;
    std::string nir_path;
    std::optional<PlantRegion> vis_plant;
    std::optional<PlantRegion> nir_plant;
    std::vector<MetricBlock> vis_blocks;
    std::vector<MetricBlock> nir_blocks;
    std::string nir_failure;
};

/**
 * @brief Plant mask construction for one VIS/NIR pair from the imaging cabinet
 *
 * Stages run strictly in order: coarse VIS mask, refined VIS mask with the
 * cabinet hardware suppressed, plant ROI selection, then the VIS to NIR mask
 * transfer. Holds only configuration and the optional debug writer, so one
 * instance can process many pairs in sequence.
 */
class CabinetPipeline {
public:
    explicit CabinetPipeline(const PipelineConfig& config = PipelineConfig());
    ~CabinetPipeline();

    /**
     * @brief Run the whole pair: segment VIS, write VIS rows, transfer to NIR, write NIR rows
     * Throws NotFoundError if the VIS image cannot be read and RoiError if the
     * cabinet ROIs do not fit the image. NIR-side failures are reported in the result.
     */
    PairResult processPair(const std::string& vis_path, const OutputOptions& output);

    /**
     * @brief Stages 1-3 on a decoded BGR image
     */
    VisSegmentation segmentVis(const cv::Mat& vis_image);

    /**
     * @brief Stage 1: light threshold of the green-magenta channel, edge filter, stopper removal
     */
    cv::Mat buildCoarseVisMask(const cv::Mat& green_channel);

    /**
     * @brief Stage 2: merge the dark threshold, filter again, fill speckles, remove stopper and screw holes
     */
    cv::Mat refineVisMask(const cv::Mat& coarse_mask, const cv::Mat& green_channel);

    /**
     * @brief Gaussian blur and re-threshold, with the plant-preserve window restored afterwards
     */
    cv::Mat edgeFilter(const cv::Mat& mask) const;

    /**
     * @brief Erase contours fully inside the stopper ROI, and the two screw-hole ROIs when asked
     * All ROIs are tested against the contours of the input mask.
     */
    cv::Mat removeFixtures(const cv::Mat& mask, bool include_screw_holes);

    /**
     * @brief Stage 3: keep objects overlapping the plant ROI and compose them
     * Returns nothing when no contour survives.
     */
    std::optional<PlantRegion> selectPlantRegion(const cv::Mat& mask);

    /**
     * @brief Map the VIS plant mask onto the NIR frame and compose its contours
     * Throws AlignmentError.
     */
    NirTransfer transferToNir(const cv::Mat& plant_mask, const cv::Size& nir_frame);

    std::vector<MetricBlock> analyzeVis(const cv::Mat& vis_image, const PlantRegion& plant,
                                        const std::string& shape_image_path = "");
    std::vector<MetricBlock> analyzeNir(const cv::Mat& nir_gray, const PlantRegion& plant,
                                        const std::string& shape_image_path = "");

    void setDebugMode(bool enabled, const std::string& debug_output_path = ".");
    void setVerbose(bool enabled) { verbose_ = enabled; }

    const PipelineConfig& config() const { return config_; }
    const NirMaskMapper& mapper() const { return mapper_; }

private:
    PipelineConfig config_;
    NirMaskMapper mapper_;
    Shape::ShapeAnalyzer shape_analyzer_;
    ColorAnalysis::ColorAnalyzer color_analyzer_;

    bool verbose_;
    std::unique_ptr<DebugImageWriter> debug_writer_;

    cv::Mat suppress(const cv::Mat& mask, const ContourSet& objects, const RoiAdjustment& adjustment,
                     const std::string& name);
    void saveDebugImage(const std::string& stage, const cv::Mat& image);
    std::string shapeImagePath(const OutputOptions& output, const std::string& file_name) const;
    void runNirTransfer(PairResult& result, const cv::Mat& plant_mask, const ImageFile& vis,
                        const OutputOptions& output);
};

} // namespace VisNir

#endif // VISNIR_CABINET_PIPELINE_HPP
