#include <opencv2/core.hpp>
#include <cstdlib>
#include <iostream>
#include <string>

#include "visnir/cabinet_pipeline.hpp"
#include "visnir/config_manager.hpp"
#include "visnir/errors.hpp"

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_INPUT_ERROR = 1,
    EXIT_CONFIG_ERROR = 2,
    EXIT_NIR_FAILED = 3
};

struct Options {
    std::string image;
    std::string result;
    std::string coresult;
    std::string outdir;
    std::string config;
    bool write_images = false;
    bool debug = false;
    bool verbose = false;
};

std::string getenv_str(const char* key, const char* def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : std::string(def);
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " -i <vis image> -r <result file> -r2 <coresult file>"
              << " [-o <outdir>] [-w] [-d] [--config <json>] [--verbose]\n"
              << "  -i, --image      Input VIS image file\n"
              << "  -r, --result     VIS result file (appended)\n"
              << "  -r2, --coresult  NIR result file for the co-processed image (appended)\n"
              << "  -o, --outdir     Output directory for image files\n"
              << "  -w, --writeimg   Create output images\n"
              << "  -d, --debug      Write intermediate images\n"
              << "  --config         JSON file overriding the cabinet constants (or VISNIR_CONFIG)\n"
              << "  --verbose        Per-stage progress\n";
}

bool parseArgs(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-i" || arg == "--image") {
            if (!next(options.image)) return false;
        } else if (arg == "-r" || arg == "--result") {
            if (!next(options.result)) return false;
        } else if (arg == "-r2" || arg == "--coresult") {
            if (!next(options.coresult)) return false;
        } else if (arg == "-o" || arg == "--outdir") {
            if (!next(options.outdir)) return false;
        } else if (arg == "--config") {
            if (!next(options.config)) return false;
        } else if (arg == "-w" || arg == "--writeimg") {
            options.write_images = true;
        } else if (arg == "-d" || arg == "--debug") {
            options.debug = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }

    if (options.image.empty() || options.result.empty() || options.coresult.empty()) {
        std::cerr << "-i, -r and -r2 are required\n";
        return false;
    }
    if (options.write_images && options.outdir.empty()) {
        std::cerr << "-w needs an output directory (-o)\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(argv[0]);
        return EXIT_INPUT_ERROR;
    }

    VisNir::ConfigManager config_manager;
    std::string config_path = options.config.empty() ? getenv_str("VISNIR_CONFIG", "") : options.config;
    if (!config_path.empty() && !config_manager.loadConfig(config_path)) {
        return EXIT_CONFIG_ERROR;
    }
    if (!config_manager.validateConfig()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config_manager.getValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return EXIT_CONFIG_ERROR;
    }

    VisNir::CabinetPipeline pipeline(config_manager.getPipelineConfig());
    pipeline.setVerbose(options.verbose);
    if (options.debug) {
        pipeline.setDebugMode(true, options.outdir.empty() ? std::string(".") : options.outdir);
    }

    VisNir::OutputOptions output;
    output.result_path = options.result;
    output.coresult_path = options.coresult;
    output.output_dir = options.outdir;
    output.write_images = options.write_images;

    try {
        VisNir::PairResult result = pipeline.processPair(options.image, output);
        std::cout << "Finished " << options.image << ": " << VisNir::statusName(result.status) << std::endl;

        if (result.status == VisNir::PipelineStatus::VIS_ONLY) {
            std::cerr << "NIR transfer failed: " << result.nir_failure << std::endl;
            return EXIT_NIR_FAILED;
        }
        return EXIT_OK;

    } catch (const VisNir::RoiError& e) {
        std::cerr << "Cabinet geometry error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    } catch (const VisNir::NotFoundError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return EXIT_INPUT_ERROR;
    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV error: " << e.what() << std::endl;
        return EXIT_INPUT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Processing error: " << e.what() << std::endl;
        return EXIT_INPUT_ERROR;
    }
}
