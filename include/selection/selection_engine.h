// include/selection/selection_engine.h
#pragma once

#include <cstddef>
#include <vector>

namespace photobooth::selection {

enum class CursorDirection {
    FORWARD,
    BACKWARD
};

enum class ToggleResult {
    ADDED,
    REMOVED,
    REJECTED_AT_CAPACITY,
    NO_CANDIDATES
};

// Pick-N-of-M logic over state owned by the Session. Holds references only,
// so replaying the same Next/Prev/Shutter sequence gives the same result.
class SelectionEngine {
public:
    SelectionEngine(std::vector<size_t>& selectedIndices, size_t& cursor,
                    size_t candidateCount, size_t requiredCount);

    // Cyclic over [0, candidateCount)
    void moveCursor(CursorDirection direction);

    // Deselect if selected, select if below requiredCount, otherwise reject
    ToggleResult toggle();

    bool isComplete() const { return selectedIndices_.size() == requiredCount_; }
    bool isSelected(size_t index) const;

    size_t cursor() const { return cursor_; }

private:
    std::vector<size_t>& selectedIndices_;
    size_t& cursor_;
    size_t candidateCount_;
    size_t requiredCount_;
};

} // namespace photobooth::selection
