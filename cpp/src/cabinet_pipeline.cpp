#include "visnir/cabinet_pipeline.hpp"
#include "visnir/errors.hpp"
#include "visnir/mask_ops.hpp"
#include "visnir/roi_suppression.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace VisNir {

const char* statusName(PipelineStatus status) {
    switch (status) {
        case PipelineStatus::NO_PLANT_FOUND: return "no_plant_found";
        case PipelineStatus::VIS_ONLY: return "vis_only";
        case PipelineStatus::COMPLETE: return "complete";
    }
    return "unknown";
}

CabinetPipeline::CabinetPipeline(const PipelineConfig& config)
    : config_(config), mapper_(config.nir), verbose_(false) {}

CabinetPipeline::~CabinetPipeline() {
    if (debug_writer_ && verbose_) {
        std::cout << "CabinetPipeline wrote " << debug_writer_->sequence() << " debug images" << std::endl;
    }
}

PairResult CabinetPipeline::processPair(const std::string& vis_path, const OutputOptions& output) {
    PairResult result;
    result.vis_path = vis_path;

    ImageFile vis = readImage(vis_path);
    std::cout << "CabinetPipeline: processing " << vis.file_name
              << " (" << vis.image.cols << "x" << vis.image.rows << ")" << std::endl;

    VisSegmentation segmentation = segmentVis(vis.image);
    if (!segmentation.plant) {
        std::cout << "CabinetPipeline: no plant found in " << vis.file_name << ", nothing written" << std::endl;
        result.status = PipelineStatus::NO_PLANT_FOUND;
        return result;
    }
    result.vis_plant = segmentation.plant;

    std::string shape_image = shapeImagePath(output, vis.file_name);
    result.vis_blocks = analyzeVis(vis.image, *segmentation.plant, shape_image);
    if (!output.result_path.empty() && !ResultWriter::appendBlocks(output.result_path, result.vis_blocks)) {
        throw std::runtime_error("Cannot write results to " + output.result_path);
    }

    result.status = PipelineStatus::VIS_ONLY;
    runNirTransfer(result, segmentation.plant->mask, vis, output);
    return result;
}

void CabinetPipeline::runNirTransfer(PairResult& result, const cv::Mat& plant_mask, const ImageFile& vis,
                                     const OutputOptions& output) {
    try {
        result.nir_path = findPairedImage(vis.directory, vis.file_name);
        cv::Mat nir_gray = readGrayImage(result.nir_path);
        std::string nir_name = fs::path(result.nir_path).filename().string();

        NirTransfer transfer = transferToNir(plant_mask, nir_gray.size());
        if (!transfer.plant) {
            result.nir_failure = "mapped mask has no contours";
            std::cerr << "CabinetPipeline: " << result.nir_failure << " for " << nir_name << std::endl;
            return;
        }
        result.nir_plant = transfer.plant;

        std::string shape_image = shapeImagePath(output, nir_name);
        result.nir_blocks = analyzeNir(nir_gray, *transfer.plant, shape_image);
        if (!output.coresult_path.empty() && !ResultWriter::appendBlocks(output.coresult_path, result.nir_blocks)) {
            result.nir_failure = "cannot write co-results to " + output.coresult_path;
            return;
        }
        result.status = PipelineStatus::COMPLETE;

    } catch (const NotFoundError& e) {
        result.nir_failure = e.what();
        std::cerr << "CabinetPipeline NIR error: " << e.what() << std::endl;
    } catch (const AlignmentError& e) {
        result.nir_failure = e.what();
        std::cerr << "CabinetPipeline alignment error: " << e.what() << std::endl;
    }
}

VisSegmentation CabinetPipeline::segmentVis(const cv::Mat& vis_image) {
    VisSegmentation segmentation;

    // Green-magenta channel of LAB
    segmentation.green_channel = MaskOps::toGrayscale(vis_image, MaskOps::ColorSpace::LAB, 'a');
    saveDebugImage("green_channel", segmentation.green_channel);

    segmentation.coarse_mask = buildCoarseVisMask(segmentation.green_channel);
    segmentation.refined_mask = refineVisMask(segmentation.coarse_mask, segmentation.green_channel);
    segmentation.plant = selectPlantRegion(segmentation.refined_mask);
    return segmentation;
}

cv::Mat CabinetPipeline::buildCoarseVisMask(const cv::Mat& green_channel) {
    const auto& t = config_.thresholds;

    // Magenta (damaged) tissue
    cv::Mat green_thresh = MaskOps::binaryThreshold(green_channel, t.green_light, MaskOps::ObjectType::LIGHT);
    saveDebugImage("green_thresh", green_thresh);

    cv::Mat filtered = edgeFilter(green_thresh);
    cv::Mat coarse = removeFixtures(filtered, false);
    saveDebugImage("coarse_mask", coarse);
    return coarse;
}

cv::Mat CabinetPipeline::refineVisMask(const cv::Mat& coarse_mask, const cv::Mat& green_channel) {
    const auto& t = config_.thresholds;

    cv::Mat green_dark = MaskOps::binaryThreshold(green_channel, t.green_dark, MaskOps::ObjectType::DARK);
    cv::Mat merged = MaskOps::logicalOr(green_dark, coarse_mask);
    saveDebugImage("green_merged", merged);

    cv::Mat filtered = edgeFilter(merged);

    // Breaks up the horizontal and vertical shadow lines of the track edges
    cv::Mat median = MaskOps::medianBlur(filtered, t.median_kernel);
    cv::Mat filled = MaskOps::fillSmallObjects(median, t.fill_min_area);
    saveDebugImage("fill", filled);

    cv::Mat refined = removeFixtures(filled, true);
    saveDebugImage("refined_mask", refined);
    return refined;
}

cv::Mat CabinetPipeline::edgeFilter(const cv::Mat& mask) const {
    const auto& t = config_.thresholds;
    const cv::Rect& window = config_.cabinet.plant_preserve_window;

    if ((window & cv::Rect(0, 0, mask.cols, mask.rows)) != window) {
        throw RoiError("Plant preserve window does not fit a " +
                       std::to_string(mask.cols) + "x" + std::to_string(mask.rows) + " mask");
    }

    cv::Mat plant_region = MaskOps::extractRegion(mask, window);
    cv::Mat blurred = MaskOps::gaussianBlur(mask, t.gaussian_kernel);
    cv::Mat thresholded = MaskOps::binaryThreshold(blurred, t.blur_rethreshold, MaskOps::ObjectType::LIGHT);
    return MaskOps::replaceRegion(thresholded, window, plant_region);
}

cv::Mat CabinetPipeline::removeFixtures(const cv::Mat& mask, bool include_screw_holes) {
    const auto& geometry = config_.cabinet;

    ContourSet objects = findObjects(mask);
    if (verbose_) {
        std::cout << "CabinetPipeline: " << objects.size() << " contours before fixture removal" << std::endl;
    }

    cv::Mat clean = suppress(mask, objects, geometry.stopper, "stopper");
    if (include_screw_holes) {
        clean = suppress(clean, objects, geometry.screw_hole_a, "screw_hole_a");
        clean = suppress(clean, objects, geometry.screw_hole_b, "screw_hole_b");
    }
    return clean;
}

cv::Mat CabinetPipeline::suppress(const cv::Mat& mask, const ContourSet& objects, const RoiAdjustment& adjustment,
                                  const std::string& name) {
    Roi roi = Roi::fromAdjustment(mask.size(), adjustment, name);

    std::vector<size_t> removed;
    cv::Mat clean = removeContoursInRoi(mask, objects, roi, &removed);
    if (verbose_) {
        std::cout << "CabinetPipeline: " << name << " ROI " << roi.rect()
                  << " removed " << removed.size() << " contours" << std::endl;
    }
    saveDebugImage("remove_" + name, clean);
    return clean;
}

std::optional<PlantRegion> CabinetPipeline::selectPlantRegion(const cv::Mat& mask) {
    Roi roi = Roi::fromAdjustment(mask.size(), config_.cabinet.plant, "plant");

    ContourSet objects = findObjects(mask);
    RoiObjects kept = selectRoiObjects(mask, objects, roi);
    if (verbose_) {
        std::cout << "CabinetPipeline: plant ROI kept " << kept.objects.size() << " of "
                  << objects.size() << " contours, area " << kept.area << std::endl;
    }

    if (kept.objects.empty()) {
        return std::nullopt;
    }

    PlantRegion plant = composeObjects(mask.size(), kept.objects);
    saveDebugImage("plant_mask", plant.mask);
    return plant;
}

NirTransfer CabinetPipeline::transferToNir(const cv::Mat& plant_mask, const cv::Size& nir_frame) {
    NirTransfer transfer;
    transfer.mask = mapper_.map(plant_mask, nir_frame);
    saveDebugImage("nir_mask", transfer.mask);

    ContourSet objects = findObjects(transfer.mask);
    if (verbose_) {
        std::cout << "CabinetPipeline: NIR mask " << transfer.mask.cols << "x" << transfer.mask.rows
                  << " with " << objects.size() << " contours" << std::endl;
    }
    if (!objects.empty()) {
        transfer.plant = composeObjects(nir_frame, objects);
    }
    return transfer;
}

std::vector<MetricBlock> CabinetPipeline::analyzeVis(const cv::Mat& vis_image, const PlantRegion& plant,
                                                     const std::string& shape_image_path) {
    Shape::ShapeMetrics shape = shape_analyzer_.analyzeShape(plant.mask, plant.contour);
    std::string written = shape_image_path;
    if (!written.empty() && !cv::imwrite(written, shape_analyzer_.drawShapes(vis_image, plant.contour, shape))) {
        std::cerr << "CabinetPipeline: failed to write " << written << std::endl;
        written.clear();
    }

    ColorAnalysis::ColorMetrics color = color_analyzer_.analyzeColor(vis_image, plant.mask);
    return {shape_analyzer_.toBlock(shape, written), color_analyzer_.toBlock(color)};
}

std::vector<MetricBlock> CabinetPipeline::analyzeNir(const cv::Mat& nir_gray, const PlantRegion& plant,
                                                     const std::string& shape_image_path) {
    ColorAnalysis::NirMetrics intensity = color_analyzer_.analyzeNirIntensity(nir_gray, plant.mask);

    Shape::ShapeMetrics shape = shape_analyzer_.analyzeShape(plant.mask, plant.contour);
    std::string written = shape_image_path;
    if (!written.empty() && !cv::imwrite(written, shape_analyzer_.drawShapes(nir_gray, plant.contour, shape))) {
        std::cerr << "CabinetPipeline: failed to write " << written << std::endl;
        written.clear();
    }

    return {color_analyzer_.toBlock(intensity), shape_analyzer_.toBlock(shape, written)};
}

void CabinetPipeline::setDebugMode(bool enabled, const std::string& debug_output_path) {
    if (enabled) {
        debug_writer_ = std::make_unique<DebugImageWriter>(debug_output_path);
        std::cout << "CabinetPipeline debug mode enabled, output: " << debug_output_path << std::endl;
    } else {
        debug_writer_.reset();
    }
}

void CabinetPipeline::saveDebugImage(const std::string& stage, const cv::Mat& image) {
    if (!debug_writer_) return;
    debug_writer_->save(stage, image);
}

std::string CabinetPipeline::shapeImagePath(const OutputOptions& output, const std::string& file_name) const {
    if (!output.write_images || output.output_dir.empty()) return "";

    std::error_code ec;
    fs::create_directories(output.output_dir, ec);
    if (ec) {
        std::cerr << "CabinetPipeline: cannot create " << output.output_dir << ": " << ec.message() << std::endl;
        return "";
    }
    return (fs::path(output.output_dir) / (fs::path(file_name).stem().string() + "_shapes.png")).string();
}

} // namespace VisNir
