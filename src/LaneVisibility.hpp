#pragma once
#include <string>
#include <vector>

#include "SceneBuilder.hpp"

enum class LaneState { Expanded, Collapsed };

/// @brief LaneVisibility — per-lane disclosure state, same contract as the viewer script.
///
/// Every lane starts expanded. toggle() flips one lane, setAll() forces every
/// lane to the same state. A task item is hidden exactly when the lane whose
/// row range contains its y is collapsed; lane headers are never hidden.
class LaneVisibility
{
public:
    explicit LaneVisibility(const Scene& scene);

    void toggle(size_t laneIndex);
    void set(size_t laneIndex, LaneState s);
    void setAll(LaneState s);

    LaneState state(size_t laneIndex) const;
    // "▼" expanded, "▶" collapsed
    const char* indicator(size_t laneIndex) const;

    bool isHidden(const SceneItem& item) const;
    std::vector<size_t> hiddenItems() const;

    size_t laneCount() const { return _states.size(); }

private:
    const Scene& _scene;
    std::vector<LaneState> _states;
};
