// src/selection/selection_engine.cpp
#include "selection/selection_engine.h"
#include <algorithm>

namespace photobooth::selection {

SelectionEngine::SelectionEngine(std::vector<size_t>& selectedIndices, size_t& cursor,
                                 size_t candidateCount, size_t requiredCount)
    : selectedIndices_(selectedIndices)
    , cursor_(cursor)
    , candidateCount_(candidateCount)
    , requiredCount_(requiredCount) {
    if (candidateCount_ == 0) {
        cursor_ = 0;
    } else if (cursor_ >= candidateCount_) {
        cursor_ %= candidateCount_;
    }
}

void SelectionEngine::moveCursor(CursorDirection direction) {
    if (candidateCount_ == 0) {
        return;
    }
    if (direction == CursorDirection::FORWARD) {
        cursor_ = (cursor_ + 1) % candidateCount_;
    } else {
        cursor_ = (cursor_ + candidateCount_ - 1) % candidateCount_;
    }
}

bool SelectionEngine::isSelected(size_t index) const {
    return std::find(selectedIndices_.begin(), selectedIndices_.end(), index) != selectedIndices_.end();
}

ToggleResult SelectionEngine::toggle() {
    if (candidateCount_ == 0) {
        return ToggleResult::NO_CANDIDATES;
    }

    auto it = std::find(selectedIndices_.begin(), selectedIndices_.end(), cursor_);
    if (it != selectedIndices_.end()) {
        selectedIndices_.erase(it);
        return ToggleResult::REMOVED;
    }
    if (selectedIndices_.size() >= requiredCount_) {
        return ToggleResult::REJECTED_AT_CAPACITY;
    }
    selectedIndices_.push_back(cursor_);
    return ToggleResult::ADDED;
}

} // namespace photobooth::selection
