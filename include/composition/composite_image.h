// include/composition/composite_image.h
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace photobooth::composition {

enum class FilterType {
    NONE,
    BLACK_AND_WHITE,
    SEPIA
};

inline std::string filterToString(FilterType filter) {
    switch (filter) {
        case FilterType::NONE: return "none";
        case FilterType::BLACK_AND_WHITE: return "black_white";
        case FilterType::SEPIA: return "sepia";
        default: return "unknown";
    }
}

// Cycles None -> BlackAndWhite -> Sepia -> None (step = +1 or -1)
inline FilterType cycleFilter(FilterType filter, int step) {
    constexpr int kFilterCount = 3;
    int index = (static_cast<int>(filter) + step % kFilterCount + kFilterCount) % kFilterCount;
    return static_cast<FilterType>(index);
}

// A4 composite produced from (template, selected photos, filter). Pixels are 8-bit BGR.
struct CompositeImage {
    cv::Mat pixels;
    std::string templateId;
    FilterType filter = FilterType::NONE;
    std::vector<std::string> sourcePaths;

    // Throws std::runtime_error when encoding fails
    std::vector<uint8_t> encodeJpeg(int quality) const;
};

} // namespace photobooth::composition
