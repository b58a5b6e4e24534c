#include "visnir/image_io.hpp"
#include "visnir/errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

namespace VisNir {

namespace {

const std::vector<std::string> IMAGE_EXTENSIONS = {".png", ".jpg", ".jpeg", ".tif", ".tiff", ".bmp"};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::vector<std::string> splitTokens(const std::string& stem) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start <= stem.size()) {
        size_t end = stem.find('_', start);
        if (end == std::string::npos) end = stem.size();
        tokens.push_back(stem.substr(start, end - start));
        start = end + 1;
    }
    return tokens;
}

bool isImageExtension(const std::string& extension) {
    return std::find(IMAGE_EXTENSIONS.begin(), IMAGE_EXTENSIONS.end(), toLower(extension)) != IMAGE_EXTENSIONS.end();
}

} // namespace

ImageFile readImage(const std::string& path) {
    ImageFile file;
    file.image = cv::imread(path, cv::IMREAD_COLOR);
    if (file.image.empty()) {
        throw NotFoundError("Cannot read image: " + path);
    }

    fs::path p(path);
    file.directory = p.has_parent_path() ? p.parent_path().string() : std::string(".");
    file.file_name = p.filename().string();
    return file;
}

cv::Mat readGrayImage(const std::string& path) {
    cv::Mat gray = cv::imread(path, cv::IMREAD_GRAYSCALE);
    if (gray.empty()) {
        throw NotFoundError("Cannot read image: " + path);
    }
    return gray;
}

std::string findPairedImage(const std::string& directory, const std::string& vis_file_name) {
    std::vector<std::string> vis_tokens = splitTokens(fs::path(vis_file_name).stem().string());
    if (vis_tokens.empty() || toUpper(vis_tokens[0]) != "VIS") {
        throw NotFoundError("Not a VIS image name: " + vis_file_name);
    }
    if (vis_tokens.size() < 2) {
        throw NotFoundError("No camera token in " + vis_file_name);
    }

    // Side views are also matched on the rotation angle token
    const std::string camera = toUpper(vis_tokens[1]);
    const bool match_angle = camera == "SV" && vis_tokens.size() > 2;
    const std::string angle = match_angle ? toLower(vis_tokens[2]) : std::string();
    const std::string exact_stem = "NIR" + fs::path(vis_file_name).stem().string().substr(vis_tokens[0].size());

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw NotFoundError("Image directory does not exist: " + directory);
    }

    std::vector<fs::path> candidates;
    fs::directory_iterator it(directory, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) continue;

        const fs::path& candidate = it->path();
        if (!isImageExtension(candidate.extension().string())) continue;

        std::vector<std::string> tokens = splitTokens(candidate.stem().string());
        if (tokens.size() < 2 || toUpper(tokens[0]) != "NIR" || toUpper(tokens[1]) != camera) continue;
        if (match_angle && (tokens.size() < 3 || toLower(tokens[2]) != angle)) continue;

        candidates.push_back(candidate);
    }
    if (ec) {
        throw NotFoundError("Cannot list " + directory + ": " + ec.message());
    }
    if (candidates.empty()) {
        throw NotFoundError("No " + camera + " NIR image for " + vis_file_name + " in " + directory);
    }

    // Same suffix as the VIS image wins, then the lowest name
    std::sort(candidates.begin(), candidates.end());
    for (const auto& candidate : candidates) {
        if (candidate.stem().string() == exact_stem) return candidate.string();
    }
    if (candidates.size() > 1) {
        std::cerr << "findPairedImage: " << candidates.size() << " NIR candidates for " << vis_file_name
                  << ", using " << candidates.front().filename().string() << std::endl;
    }
    return candidates.front().string();
}

DebugImageWriter::DebugImageWriter(const std::string& output_dir)
    : output_dir_(output_dir), sequence_(0) {
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        std::cerr << "DebugImageWriter: cannot create " << output_dir_ << ": " << ec.message() << std::endl;
    }
}

std::string DebugImageWriter::save(const std::string& stage, const cv::Mat& image) {
    ++sequence_;
    std::string path = (fs::path(output_dir_) / (std::to_string(sequence_) + "_" + stage + ".png")).string();

    try {
        if (!cv::imwrite(path, image)) {
            std::cerr << "DebugImageWriter: failed to write " << path << std::endl;
            return "";
        }
    } catch (const cv::Exception& e) {
        std::cerr << "Debug image save error: " << e.what() << std::endl;
        return "";
    }
    return path;
}

} // namespace VisNir
