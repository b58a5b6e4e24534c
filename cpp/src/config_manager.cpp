#include "visnir/config_manager.hpp"
#include "visnir/errors.hpp"
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace VisNir {

namespace {

VerticalAnchor parseVertical(const std::string& name) {
    if (name == "top") return VerticalAnchor::TOP;
    if (name == "bottom") return VerticalAnchor::BOTTOM;
    throw std::invalid_argument("Unknown vertical anchor: " + name);
}

HorizontalAnchor parseHorizontal(const std::string& name) {
    if (name == "left") return HorizontalAnchor::LEFT;
    if (name == "right") return HorizontalAnchor::RIGHT;
    throw std::invalid_argument("Unknown horizontal anchor: " + name);
}

bool isOddKernel(int k) {
    return k > 0 && k % 2 == 1;
}

bool isByteThreshold(int t) {
    return t >= 0 && t <= 255;
}

} // namespace

ConfigManager::ConfigManager() : config_json(nlohmann::json::object()), is_loaded(false) {}

ConfigManager::~ConfigManager() {}

bool ConfigManager::loadConfig(const std::string& config_path) {
    config_file_path = config_path;

    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "Failed to open config file: " << config_path << std::endl;
            return false;
        }

        nlohmann::json parsed;
        config_file >> parsed;
        config_file.close();

        if (!loadConfigJson(parsed)) {
            return false;
        }

        std::cout << "Configuration loaded successfully from: " << config_path << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadConfigJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        std::cerr << "Error loading configuration: top level must be an object" << std::endl;
        return false;
    }

    try {
        config_json = json;
        pipeline_config = PipelineConfig();
        parseConfig();
        is_loaded = true;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing configuration: " << e.what() << std::endl;
        pipeline_config = PipelineConfig();
        is_loaded = false;
        return false;
    }
}

bool ConfigManager::reloadConfig() {
    if (config_file_path.empty()) {
        std::cerr << "No config file path set for reload" << std::endl;
        return false;
    }
    return loadConfig(config_file_path);
}

void ConfigManager::parseConfig() {
    parseThresholds();
    parseCabinet();
    parseNirTransfer();
}

void ConfigManager::parseThresholds() {
    if (!config_json.contains("thresholds")) return;

    const auto& thresholds = config_json["thresholds"];
    auto& t = pipeline_config.thresholds;
    t.green_light = thresholds.value("green_light", t.green_light);
    t.green_dark = thresholds.value("green_dark", t.green_dark);
    t.blur_rethreshold = thresholds.value("blur_rethreshold", t.blur_rethreshold);
    t.gaussian_kernel = thresholds.value("gaussian_kernel", t.gaussian_kernel);
    t.median_kernel = thresholds.value("median_kernel", t.median_kernel);
    t.fill_min_area = thresholds.value("fill_min_area", t.fill_min_area);
}

void ConfigManager::parseCabinet() {
    if (!config_json.contains("cabinet")) return;

    const auto& cabinet = config_json["cabinet"];
    auto& geometry = pipeline_config.cabinet;

    if (cabinet.contains("reference_frame")) {
        const auto& frame = cabinet["reference_frame"];
        geometry.reference_frame.width = frame.value("width", geometry.reference_frame.width);
        geometry.reference_frame.height = frame.value("height", geometry.reference_frame.height);
    }

    if (cabinet.contains("plant_preserve_window")) {
        const auto& window = cabinet["plant_preserve_window"];
        geometry.plant_preserve_window = cv::Rect(
            window.value("x", geometry.plant_preserve_window.x),
            window.value("y", geometry.plant_preserve_window.y),
            window.value("width", geometry.plant_preserve_window.width),
            window.value("height", geometry.plant_preserve_window.height)
        );
    }

    if (cabinet.contains("rois")) {
        const auto& rois = cabinet["rois"];
        if (rois.contains("stopper")) geometry.stopper = parseRoi(rois["stopper"], geometry.stopper);
        if (rois.contains("screw_hole_a")) geometry.screw_hole_a = parseRoi(rois["screw_hole_a"], geometry.screw_hole_a);
        if (rois.contains("screw_hole_b")) geometry.screw_hole_b = parseRoi(rois["screw_hole_b"], geometry.screw_hole_b);
        if (rois.contains("plant")) geometry.plant = parseRoi(rois["plant"], geometry.plant);
    }
}

void ConfigManager::parseNirTransfer() {
    if (!config_json.contains("nir_transfer")) return;

    const auto& nir = config_json["nir_transfer"];
    auto& mapping = pipeline_config.nir;
    mapping.dilate_radius = nir.value("dilate_radius", mapping.dilate_radius);
    mapping.dilate_iterations = nir.value("dilate_iterations", mapping.dilate_iterations);

    if (nir.contains("sensors")) {
        const auto& sensors = nir["sensors"];
        auto& s = mapping.sensors;
        s.vis_width = sensors.value("vis_width", s.vis_width);
        s.vis_height = sensors.value("vis_height", s.vis_height);
        s.nir_x = sensors.value("nir_x", s.nir_x);
        s.nir_y = sensors.value("nir_y", s.nir_y);
        s.conversion_x = sensors.value("conversion_x", s.conversion_x);
        s.conversion_y = sensors.value("conversion_y", s.conversion_y);
        s.rat = sensors.value("rat", s.rat);
    }

    if (nir.contains("position")) {
        const auto& position = nir["position"];
        auto& p = mapping.position;
        p.x = position.value("x", p.x);
        p.y = position.value("y", p.y);
        if (position.contains("vertical")) p.vertical = parseVertical(position["vertical"].get<std::string>());
        if (position.contains("horizontal")) p.horizontal = parseHorizontal(position["horizontal"].get<std::string>());
    }
}

RoiAdjustment ConfigManager::parseRoi(const nlohmann::json& j, const RoiAdjustment& defaults) {
    RoiAdjustment roi;
    roi.x_adj = j.value("x_adj", defaults.x_adj);
    roi.y_adj = j.value("y_adj", defaults.y_adj);
    roi.w_adj = j.value("w_adj", defaults.w_adj);
    roi.h_adj = j.value("h_adj", defaults.h_adj);
    return roi;
}

const PipelineConfig& ConfigManager::getPipelineConfig() const {
    return pipeline_config;
}

bool ConfigManager::validateConfig() const {
    return getValidationErrors().empty();
}

std::vector<std::string> ConfigManager::getValidationErrors() const {
    std::vector<std::string> errors;
    const auto& t = pipeline_config.thresholds;
    const auto& geometry = pipeline_config.cabinet;
    const auto& nir = pipeline_config.nir;

    if (!isByteThreshold(t.green_light)) errors.push_back("thresholds.green_light must be in 0..255");
    if (!isByteThreshold(t.green_dark)) errors.push_back("thresholds.green_dark must be in 0..255");
    if (!isByteThreshold(t.blur_rethreshold)) errors.push_back("thresholds.blur_rethreshold must be in 0..255");
    if (!isOddKernel(t.gaussian_kernel)) errors.push_back("thresholds.gaussian_kernel must be odd and positive");
    if (!isOddKernel(t.median_kernel)) errors.push_back("thresholds.median_kernel must be odd and positive");
    if (t.fill_min_area < 0) errors.push_back("thresholds.fill_min_area must not be negative");

    const cv::Size& frame = geometry.reference_frame;
    if (frame.width <= 0 || frame.height <= 0) {
        errors.push_back("cabinet.reference_frame must have positive size");
        return errors;
    }

    const cv::Rect& window = geometry.plant_preserve_window;
    if (window.width <= 0 || window.height <= 0 ||
        (window & cv::Rect(0, 0, frame.width, frame.height)) != window) {
        errors.push_back("cabinet.plant_preserve_window must lie inside the reference frame");
    }

    const std::pair<const char*, const RoiAdjustment*> rois[] = {
        {"stopper", &geometry.stopper},
        {"screw_hole_a", &geometry.screw_hole_a},
        {"screw_hole_b", &geometry.screw_hole_b},
        {"plant", &geometry.plant}
    };
    for (const auto& [name, adjustment] : rois) {
        try {
            Roi::fromAdjustment(frame, *adjustment, name);
        } catch (const RoiError& e) {
            errors.push_back(std::string("cabinet.rois.") + e.what());
        }
    }

    const auto& s = nir.sensors;
    if (s.vis_width <= 0 || s.vis_height <= 0 || s.nir_x <= 0 || s.nir_y <= 0 ||
        s.conversion_x <= 0 || s.conversion_y <= 0 || s.rat <= 0) {
        errors.push_back("nir_transfer.sensors values must all be positive");
    }
    if (nir.dilate_radius < 0) errors.push_back("nir_transfer.dilate_radius must not be negative");
    if (nir.dilate_iterations < 0) errors.push_back("nir_transfer.dilate_iterations must not be negative");
    if (nir.position.x < 0 || nir.position.y < 0) {
        errors.push_back("nir_transfer.position offsets must not be negative; use the anchors for direction");
    }

    return errors;
}

bool ConfigManager::exportConfig(const std::string& export_path) const {
    try {
        std::ofstream export_file(export_path);
        if (!export_file.is_open()) {
            std::cerr << "Failed to open export file: " << export_path << std::endl;
            return false;
        }
        export_file << toJson(pipeline_config).dump(2) << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error exporting configuration: " << e.what() << std::endl;
        return false;
    }
}

nlohmann::json ConfigManager::toJson(const PipelineConfig& config) {
    auto roi_json = [](const RoiAdjustment& roi) {
        return nlohmann::json{{"x_adj", roi.x_adj}, {"y_adj", roi.y_adj}, {"w_adj", roi.w_adj}, {"h_adj", roi.h_adj}};
    };

    const auto& t = config.thresholds;
    const auto& g = config.cabinet;
    const auto& n = config.nir;

    return nlohmann::json{
        {"thresholds", {
            {"green_light", t.green_light},
            {"green_dark", t.green_dark},
            {"blur_rethreshold", t.blur_rethreshold},
            {"gaussian_kernel", t.gaussian_kernel},
            {"median_kernel", t.median_kernel},
            {"fill_min_area", t.fill_min_area}
        }},
        {"cabinet", {
            {"reference_frame", {{"width", g.reference_frame.width}, {"height", g.reference_frame.height}}},
            {"plant_preserve_window", {
                {"x", g.plant_preserve_window.x},
                {"y", g.plant_preserve_window.y},
                {"width", g.plant_preserve_window.width},
                {"height", g.plant_preserve_window.height}
            }},
            {"rois", {
                {"stopper", roi_json(g.stopper)},
                {"screw_hole_a", roi_json(g.screw_hole_a)},
                {"screw_hole_b", roi_json(g.screw_hole_b)},
                {"plant", roi_json(g.plant)}
            }}
        }},
        {"nir_transfer", {
            {"dilate_radius", n.dilate_radius},
            {"dilate_iterations", n.dilate_iterations},
            {"sensors", {
                {"vis_width", n.sensors.vis_width},
                {"vis_height", n.sensors.vis_height},
                {"nir_x", n.sensors.nir_x},
                {"nir_y", n.sensors.nir_y},
                {"conversion_x", n.sensors.conversion_x},
                {"conversion_y", n.sensors.conversion_y},
                {"rat", n.sensors.rat}
            }},
            {"position", {
                {"x", n.position.x},
                {"y", n.position.y},
                {"vertical", n.position.vertical == VerticalAnchor::TOP ? "top" : "bottom"},
                {"horizontal", n.position.horizontal == HorizontalAnchor::LEFT ? "left" : "right"}
            }}
        }}
    };
}

} // namespace VisNir
