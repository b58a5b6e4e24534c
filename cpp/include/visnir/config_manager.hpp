#ifndef VISNIR_CONFIG_MANAGER_HPP
#define VISNIR_CONFIG_MANAGER_HPP

#include "visnir/nir_mapper.hpp"
#include "visnir/roi.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace VisNir {

// Empirical segmentation constants for the VIS camera.
struct ThresholdConfig {
    int green_light = 137;        // LAB 'a' above this: magenta/damaged tissue
    int green_dark = 120;         // LAB 'a' below this: green tissue
    int blur_rethreshold = 250;   // survives the Gaussian pass only if nearly solid
    int gaussian_kernel = 7;
    int median_kernel = 7;
    int fill_min_area = 100;      // speckle size in pixels
};

/**
 * Fixed hardware of the imaging cabinet, in VIS pixels of the reference frame.
 * ROIs are offsets from the default frame rectangle (see RoiAdjustment).
 */
struct CabinetGeometry {
    cv::Size reference_frame = cv::Size(2454, 2056);

    // Rows 250..2000, cols 250..2250: left untouched by the edge filter
    cv::Rect plant_preserve_window = cv::Rect(250, 250, 2000, 1750);

    RoiAdjustment stopper = {1480, 850, -870, -1075};
    RoiAdjustment screw_hole_a = {2000, 945, -220, -880};
    RoiAdjustment screw_hole_b = {1660, 990, -600, -1000};
    RoiAdjustment plant = {565, 200, -520, -250};
};

struct PipelineConfig {
    ThresholdConfig thresholds;
    CabinetGeometry cabinet;
    NirMappingConfig nir;
};

class ConfigManager {
private:
    nlohmann::json config_json;
    std::string config_file_path;

    PipelineConfig pipeline_config;
    bool is_loaded;

public:
    ConfigManager();
    ~ConfigManager();

    // Configuration loading and validation
    bool loadConfig(const std::string& config_path);
    bool loadConfigJson(const nlohmann::json& json);
    bool reloadConfig();
    bool validateConfig() const;
    std::vector<std::string> getValidationErrors() const;

    const PipelineConfig& getPipelineConfig() const;
    bool isLoaded() const { return is_loaded; }

    // Configuration persistence
    bool exportConfig(const std::string& export_path) const;
    static nlohmann::json toJson(const PipelineConfig& config);

private:
    void parseConfig();
    void parseThresholds();
    void parseCabinet();
    void parseNirTransfer();

    static RoiAdjustment parseRoi(const nlohmann::json& j, const RoiAdjustment& defaults);
};

} // namespace VisNir

#endif // VISNIR_CONFIG_MANAGER_HPP
