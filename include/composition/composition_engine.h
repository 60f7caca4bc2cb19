// include/composition/composition_engine.h
#pragma once

#include "composition/composite_image.h"
#include "templates/template_catalog.h"
#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace photobooth::composition {

// Broken layout invariant or unreadable input; the session cannot continue
class CompositionError : public std::runtime_error {
public:
    explicit CompositionError(const std::string& what) : std::runtime_error(what) {}
};

struct CompositionSettings {
    bool mirror = true;                          // match the mirrored live preview
    cv::Scalar backgroundColor{34, 34, 34};      // BGR, used without a template background
};

// Lays selected photos into a template on the A4 canvas, then filters the canvas.
// Stateless and deterministic: identical inputs give identical pixels.
class CompositionEngine {
public:
    explicit CompositionEngine(CompositionSettings settings = CompositionSettings());

    // photoPaths[i] goes into tmpl.rects[i]; throws CompositionError
    CompositeImage compose(const templates::Template& tmpl,
                           const std::vector<std::string>& photoPaths,
                           FilterType filter) const;

    // Pixel rectangle of a percentage slot, truncated like the print layout tool
    static cv::Rect slotToPixels(const templates::SlotRect& slot,
                                 int canvasWidth = templates::kCanvasWidth,
                                 int canvasHeight = templates::kCanvasHeight);

    // Scale to cover target, centre, clip to target and canvas
    static void placeCropToFill(cv::Mat& canvas, const cv::Mat& photo, const cv::Rect& target);

    static void applyFilter(cv::Mat& canvas, FilterType filter);

private:
    cv::Mat createCanvas(const templates::Template& tmpl) const;

    CompositionSettings settings_;
};

} // namespace photobooth::composition
