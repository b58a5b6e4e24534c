#ifndef VISNIR_IMAGE_IO_HPP
#define VISNIR_IMAGE_IO_HPP

#include <opencv2/core.hpp>
#include <string>

namespace VisNir {

struct ImageFile {
    cv::Mat image;
    std::string directory;
    std::string file_name;
};

// Colour read (BGR). Throws NotFoundError if the file is missing or cannot be decoded.
ImageFile readImage(const std::string& path);

cv::Mat readGrayImage(const std::string& path);

/**
 * Path of the NIR image taken together with a VIS image.
 * Names are '_'-separated tokens: modality, camera, then for side views (SV)
 * the rotation angle. A candidate must be an image whose first token is "NIR"
 * and whose camera (and SV angle) tokens match; exposure and image id may differ.
 * A candidate with the VIS name's exact suffix is preferred. Throws NotFoundError.
 */
std::string findPairedImage(const std::string& directory, const std::string& vis_file_name);

/**
 * Numbered debug image output, "<dir>/<seq>_<stage>.png".
 * Each writer owns its sequence; nothing is shared between pipeline runs.
 */
class DebugImageWriter {
public:
    explicit DebugImageWriter(const std::string& output_dir);

    // Returns the written path, or an empty string if the write failed.
    std::string save(const std::string& stage, const cv::Mat& image);

    int sequence() const { return sequence_; }

private:
    std::string output_dir_;
    int sequence_;
};

} // namespace VisNir

#endif // VISNIR_IMAGE_IO_HPP
