#include "LaneVisibility.hpp"
#include <stdexcept>

LaneVisibility::LaneVisibility(const Scene& scene)
    : _scene{ scene }
    , _states(scene.lanes.size(), LaneState::Expanded)
{
}

void LaneVisibility::toggle(size_t laneIndex)
{
    LaneState& s = _states.at(laneIndex);
    s = (s == LaneState::Expanded) ? LaneState::Collapsed : LaneState::Expanded;
}

void LaneVisibility::set(size_t laneIndex, LaneState s)
{
    _states.at(laneIndex) = s;
}

void LaneVisibility::setAll(LaneState s)
{
    for (size_t i = 0; i < _states.size(); ++i)
        set(i, s);
}

LaneState LaneVisibility::state(size_t laneIndex) const
{
    return _states.at(laneIndex);
}

const char* LaneVisibility::indicator(size_t laneIndex) const
{
    return state(laneIndex) == LaneState::Collapsed ? "\xE2\x96\xB6" : "\xE2\x96\xBC";
}

bool LaneVisibility::isHidden(const SceneItem& item) const
{
    if (item.kind != ItemKind::Task) return false;
    for (const LaneBlock& b : _scene.lanes)
    {
        if (b.containsY(item.y))
            return _states[b.laneIndex] == LaneState::Collapsed;
    }
    return false;
}

std::vector<size_t> LaneVisibility::hiddenItems() const
{
    std::vector<size_t> out;
    for (const LaneBlock& b : _scene.lanes)
    {
        if (_states[b.laneIndex] != LaneState::Collapsed) continue;
        out.insert(out.end(), b.taskItems.begin(), b.taskItems.end());
    }
    return out;
}
