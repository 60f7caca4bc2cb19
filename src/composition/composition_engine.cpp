// src/composition/composition_engine.cpp
#include "composition/composition_engine.h"
#include "logging/logger.h"
#include <algorithm>
#include <cmath>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace photobooth::composition {

namespace {

// Sepia end points (RGB): #2e1f0f for black, #f4e1c1 for white
constexpr int kSepiaDark[3] = {0x2e, 0x1f, 0x0f};
constexpr int kSepiaLight[3] = {0xf4, 0xe1, 0xc1};

int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

cv::Mat buildSepiaLut() {
    cv::Mat lut(1, 256, CV_8UC3);
    for (int i = 0; i < 256; ++i) {
        cv::Vec3b& entry = lut.at<cv::Vec3b>(0, i);
        // BGR order
        for (int c = 0; c < 3; ++c) {
            int rgbIndex = 2 - c;
            int dark = kSepiaDark[rgbIndex];
            int light = kSepiaLight[rgbIndex];
            entry[c] = cv::saturate_cast<uchar>(dark + i * (light - dark) / 255);
        }
    }
    return lut;
}

} // namespace

CompositionEngine::CompositionEngine(CompositionSettings settings)
    : settings_(settings) {
}

cv::Rect CompositionEngine::slotToPixels(const templates::SlotRect& slot, int canvasWidth, int canvasHeight) {
    int x = static_cast<int>(slot.leftPct / 100.0 * canvasWidth);
    int y = static_cast<int>(slot.topPct / 100.0 * canvasHeight);
    int w = static_cast<int>(slot.widthPct / 100.0 * canvasWidth);
    int h = static_cast<int>(slot.heightPct / 100.0 * canvasHeight);
    return cv::Rect(x, y, w, h);
}

cv::Mat CompositionEngine::createCanvas(const templates::Template& tmpl) const {
    const cv::Size canvasSize(templates::kCanvasWidth, templates::kCanvasHeight);
    if (tmpl.backgroundPath.empty()) {
        return cv::Mat(canvasSize, CV_8UC3, settings_.backgroundColor);
    }

    cv::Mat background = cv::imread(tmpl.backgroundPath, cv::IMREAD_COLOR);
    if (background.empty()) {
        throw CompositionError("cannot read background " + tmpl.backgroundPath + " of template " + tmpl.id);
    }
    if (background.size() != canvasSize) {
        cv::Mat resized;
        cv::resize(background, resized, canvasSize, 0, 0, cv::INTER_LANCZOS4);
        return resized;
    }
    return background;
}

void CompositionEngine::placeCropToFill(cv::Mat& canvas, const cv::Mat& photo, const cv::Rect& target) {
    if (target.width <= 0 || target.height <= 0 || photo.empty()) {
        return;
    }

    double scale = std::max(static_cast<double>(target.width) / photo.cols,
                            static_cast<double>(target.height) / photo.rows);
    int scaledWidth = std::max(target.width, static_cast<int>(photo.cols * scale));
    int scaledHeight = std::max(target.height, static_cast<int>(photo.rows * scale));

    cv::Mat scaled;
    if (scaledWidth == photo.cols && scaledHeight == photo.rows) {
        scaled = photo;
    } else {
        cv::resize(photo, scaled, cv::Size(scaledWidth, scaledHeight), 0, 0, cv::INTER_LANCZOS4);
    }

    // Centre the scaled photo on the slot; the overhang is cropped away
    int offsetX = floorDiv(target.width - scaledWidth, 2);
    int offsetY = floorDiv(target.height - scaledHeight, 2);
    cv::Rect source(-offsetX, -offsetY, target.width, target.height);

    cv::Rect destination = target & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (destination.empty()) {
        return;
    }
    source.x += destination.x - target.x;
    source.y += destination.y - target.y;
    source.width = destination.width;
    source.height = destination.height;

    scaled(source).copyTo(canvas(destination));
}

void CompositionEngine::applyFilter(cv::Mat& canvas, FilterType filter) {
    if (filter == FilterType::NONE) {
        return;
    }

    cv::Mat gray;
    cv::cvtColor(canvas, gray, cv::COLOR_BGR2GRAY);
    cv::cvtColor(gray, canvas, cv::COLOR_GRAY2BGR);

    if (filter == FilterType::SEPIA) {
        static const cv::Mat sepiaLut = buildSepiaLut();
        cv::Mat toned;
        cv::LUT(canvas, sepiaLut, toned);
        canvas = toned;
    }
}

CompositeImage CompositionEngine::compose(const templates::Template& tmpl,
                                          const std::vector<std::string>& photoPaths,
                                          FilterType filter) const {
    if (tmpl.rects.size() != static_cast<size_t>(tmpl.slotCount)) {
        throw CompositionError("template " + tmpl.id + " has " + std::to_string(tmpl.rects.size()) +
                               " rects for " + std::to_string(tmpl.slotCount) + " slots");
    }
    if (photoPaths.size() != tmpl.rects.size()) {
        throw CompositionError("template " + tmpl.id + " needs " + std::to_string(tmpl.rects.size()) +
                               " photos, got " + std::to_string(photoPaths.size()));
    }

    CompositeImage result;
    result.templateId = tmpl.id;
    result.filter = filter;
    result.sourcePaths = photoPaths;
    result.pixels = createCanvas(tmpl);

    for (size_t i = 0; i < photoPaths.size(); ++i) {
        cv::Mat photo = cv::imread(photoPaths[i], cv::IMREAD_COLOR);
        if (photo.empty()) {
            throw CompositionError("cannot read photo " + photoPaths[i]);
        }
        if (settings_.mirror) {
            cv::Mat mirrored;
            cv::flip(photo, mirrored, 1);
            photo = mirrored;
        }
        placeCropToFill(result.pixels, photo, slotToPixels(tmpl.rects[i]));
    }

    applyFilter(result.pixels, filter);

    logging::Logger::getInstance().debug("Composed template " + tmpl.id + " with " +
                                         std::to_string(photoPaths.size()) + " photo(s), filter " +
                                         filterToString(filter));
    return result;
}

} // namespace photobooth::composition
