#pragma once
#include <string>
#include <vector>
#include <cstdint>

#include "model.hpp"
#include "config.hpp"
#include "TimeRuler.hpp"

enum class ItemKind { LaneHeader, Task };

/// @brief SceneItem — one positioned drawable, enough for the renderer to place and annotate it.
struct SceneItem
{
    ItemKind    kind = ItemKind::Task;
    size_t      id = 0;                 // index in Scene::items
    double      x = 0, y = 0, w = 0, h = 0;
    std::string fill;
    std::string lane;
    size_t      laneIndex = 0;

    // task only
    std::string label;
    std::string text;                   // truncated label, empty when too narrow
    double      start = 0, end = 0;
    int         row = -1;               // inside the lane
    int         globalRow = -1;
    const Task* task = nullptr;         // source record (args, overhead)

    // overhead fragment [end, end + overhead]
    bool        hasOverhead = false;
    double      ovX = 0, ovW = 0;
};

/// @brief LaneBlock — lane -> row range index, built once and shipped to the viewer.
struct LaneBlock
{
    std::string lane;
    size_t      laneIndex = 0;
    int         rowOffset = 0;          // rows of all previous lanes
    int         rowCount = 0;
    double      yTop = 0;               // y of row 0
    double      yBottom = 0;            // yTop + rowCount * pitch
    size_t      headerItem = 0;
    std::vector<size_t>   taskItems;
    std::vector<uint32_t> densityBins;  // collapsed sparkline

    // true when a drawable at y belongs to this lane's rows
    bool containsY(double y) const { return y >= yTop && y < yBottom; }
};

/// @brief Scene — ordered drawable list plus the lane index and ruler.
struct Scene
{
    LayoutConfig cfg;
    TimeRange    range;                 // layout range (widened when degenerate)
    double       width = 0;
    double       height = 0;
    int          totalRows = 0;
    std::vector<SceneItem> items;       // header, its tasks, next header, ...
    std::vector<LaneBlock> lanes;       // lexicographic by lane id
    std::vector<TimeRuler::Tick> ticks;

    const LaneBlock* findLane(const std::string& lane) const;
};

/// @brief SceneBuilder — lanes -> packed rows -> positioned, colored items.
class SceneBuilder
{
public:
    explicit SceneBuilder(LayoutConfig cfg);

    // Packs every lane, attaches Task::row / Task::resolvedColor and composes
    // the scene. Tasks must outlive the returned scene (items point into it).
    Scene build(std::vector<Task>& tasks) const;

    // header_height + (rowOffset + row) * pitch + laneIndex * track_spacing
    double rowY(int rowOffset, int row, size_t laneIndex) const;

    const LayoutConfig& config() const { return _cfg; }

private:
    std::vector<uint32_t> densityBins(const std::vector<Task*>& lane, const TimeRange& range) const;

    LayoutConfig _cfg;
};
