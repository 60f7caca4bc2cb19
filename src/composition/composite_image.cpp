// src/composition/composite_image.cpp
#include "composition/composite_image.h"
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>

namespace photobooth::composition {

std::vector<uint8_t> CompositeImage::encodeJpeg(int quality) const {
    if (pixels.empty()) {
        throw std::runtime_error("cannot encode empty composite");
    }
    std::vector<uint8_t> bytes;
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    if (!cv::imencode(".jpg", pixels, bytes, params)) {
        throw std::runtime_error("JPEG encoding failed for composite of template " + templateId);
    }
    return bytes;
}

} // namespace photobooth::composition
