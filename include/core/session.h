// include/core/session.h
#pragma once

#include "composition/composite_image.h"
#include "templates/template_catalog.h"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace photobooth::core {

enum class SessionState {
    ATTRACT,
    TEMPLATE,
    COUNTDOWN,
    CAPTURING,
    QUICK_REVIEW,
    SELECTION,
    REVIEW,
    PRINTING
};

inline std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::ATTRACT: return "attract";
        case SessionState::TEMPLATE: return "template";
        case SessionState::COUNTDOWN: return "countdown";
        case SessionState::CAPTURING: return "capturing";
        case SessionState::QUICK_REVIEW: return "quick_review";
        case SessionState::SELECTION: return "selection";
        case SessionState::REVIEW: return "review";
        case SessionState::PRINTING: return "printing";
        default: return "unknown";
    }
}

struct Photo {
    std::string path;
    std::chrono::system_clock::time_point capturedAt;
};

// The single live unit of work, owned by the SessionController
struct Session {
    std::string sessionId;
    const templates::Template* tmpl = nullptr;       // borrowed from the TemplateCatalog
    std::vector<Photo> capturedPhotos;
    std::vector<size_t> selectedIndices;              // in selection order
    size_t selectionCursor = 0;
    composition::FilterType activeFilter = composition::FilterType::NONE;
    std::chrono::steady_clock::time_point startedAt;
    std::chrono::steady_clock::time_point lastActivityAt;

    int captureRetries = 0;                           // consecutive failures of the current shot
    std::shared_ptr<const composition::CompositeImage> composite;
    std::string lastError;

    size_t slotCount() const { return tmpl ? static_cast<size_t>(tmpl->slotCount) : 0; }
    size_t requiredShots() const { return tmpl ? slotCount() + 2 : 0; }
};

} // namespace photobooth::core
