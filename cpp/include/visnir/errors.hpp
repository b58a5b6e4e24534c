#ifndef VISNIR_ERRORS_HPP
#define VISNIR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace VisNir {

// Resized VIS mask is smaller than the NIR frame on at least one axis.
class AlignmentError : public std::runtime_error {
public:
    explicit AlignmentError(const std::string& what) : std::runtime_error(what) {}
};

// Missing input: unreadable image or no NIR counterpart for a VIS image.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& what) : std::runtime_error(what) {}
};

// Degenerate or out-of-frame ROI. The cabinet constants do not match the image.
class RoiError : public std::invalid_argument {
public:
    explicit RoiError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace VisNir

#endif // VISNIR_ERRORS_HPP
