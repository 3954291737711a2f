#include "SceneBuilder.hpp"
#include "row_packer.hpp"
#include "time_axis.hpp"
#include "color_helper.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

const LaneBlock* Scene::findLane(const std::string& lane) const
{
    auto it = std::lower_bound(lanes.begin(), lanes.end(), lane,
        [](const LaneBlock& b, const std::string& id) { return b.lane < id; });
    if (it == lanes.end() || it->lane != lane) return nullptr;
    return &*it;
}

SceneBuilder::SceneBuilder(LayoutConfig cfg)
    : _cfg{ std::move(cfg) }
{
}

double SceneBuilder::rowY(int rowOffset, int row, size_t laneIndex) const
{
    return double(_cfg.headerHeight)
        + double(rowOffset + row) * double(_cfg.rowPitch())
        + double(laneIndex) * double(_cfg.trackSpacing);
}

std::vector<uint32_t> SceneBuilder::densityBins(const std::vector<Task*>& lane, const TimeRange& range) const
{
    const int binCount = std::max(1, _cfg.densityBins);
    std::vector<uint32_t> bins(size_t(binCount), 0);
    const double binWidth = range.span() / double(binCount);

    auto binOf = [&](double t) -> int {
        const double f = std::floor((t - range.start) / binWidth);
        if (!(f >= 0.0)) return 0;
        if (f >= double(binCount)) return binCount - 1;
        return int(f);
        };

    for (const Task* t : lane)
    {
        int b0 = binOf(t->start);
        int b1 = binOf(t->end);
        // end < start still marks its span
        if (b1 < b0) std::swap(b0, b1);
        if (b1 - b0 <= 4)
        {
            for (int b = b0; b <= b1; ++b) bins[size_t(b)]++;
        }
        else
        {
            // long task: mark both ends only
            bins[size_t(b0)]++;
            bins[size_t(b1)]++;
        }
    }
    return bins;
}

Scene SceneBuilder::build(std::vector<Task>& tasks) const
{
    Scene scene;
    scene.cfg = _cfg;
    scene.range = computeLayoutRange(tasks);
    scene.width = _cfg.widthPx;

    const TimeAxis axis(scene.range, _cfg);
    const double pitch = _cfg.rowPitch();

    // lanes -> tasks, ordered by lane id
    std::map<std::string, std::vector<Task*>> byLane;
    for (Task& t : tasks) byLane[t.lane].push_back(&t);

    scene.items.reserve(tasks.size() + byLane.size());
    scene.lanes.reserve(byLane.size());

    int rowOffset = 0;
    size_t laneIndex = 0;
    for (auto& [laneId, laneTasks] : byLane)
    {
        std::vector<const Task*> view(laneTasks.begin(), laneTasks.end());
        const LanePacking packing = pack_lane(view);

        LaneBlock block;
        block.lane = laneId;
        block.laneIndex = laneIndex;
        block.rowOffset = rowOffset;
        block.rowCount = packing.rowCount;
        block.yTop = rowY(rowOffset, 0, laneIndex);
        block.yBottom = block.yTop + double(packing.rowCount) * pitch;
        block.densityBins = densityBins(laneTasks, scene.range);

        // header
        {
            SceneItem header;
            header.kind = ItemKind::LaneHeader;
            header.id = scene.items.size();
            header.x = 0;
            header.y = block.yTop;
            header.w = _cfg.widthPx;
            header.h = pitch;
            header.fill = color::kHeaderBg;
            header.lane = laneId;
            header.laneIndex = laneIndex;
            block.headerItem = header.id;
            scene.items.push_back(std::move(header));
        }

        // tasks, in placement order
        for (size_t idx : packing.order)
        {
            Task& t = *laneTasks[idx];
            t.row = packing.rows[idx];
            t.resolvedColor = color::resolveCss(t);

            SceneItem it;
            it.kind = ItemKind::Task;
            it.id = scene.items.size();
            it.x = axis.x(t.start);
            it.w = axis.width(t.start, t.end, _cfg.minTaskWidth);
            it.y = rowY(rowOffset, t.row, laneIndex);
            it.h = _cfg.rowHeight;
            it.fill = t.resolvedColor;
            it.lane = laneId;
            it.laneIndex = laneIndex;
            it.label = t.label;
            it.start = t.start;
            it.end = t.end;
            it.row = t.row;
            it.globalRow = rowOffset + t.row;
            it.task = &t;
            if (it.w > _cfg.labelMinWidth)
                it.text = truncateUtf8(t.label, size_t(std::max(0, _cfg.labelMaxChars)));
            if (t.overheadDuration && *t.overheadDuration > 0.0)
            {
                it.hasOverhead = true;
                it.ovX = axis.x(t.end);
                it.ovW = axis.width(t.end, t.end + *t.overheadDuration, _cfg.minTaskWidth);
            }
            block.taskItems.push_back(it.id);
            scene.items.push_back(std::move(it));
        }

        rowOffset += packing.rowCount;
        scene.lanes.push_back(std::move(block));
        ++laneIndex;
    }

    scene.totalRows = rowOffset;
    scene.height = double(_cfg.headerHeight)
        + double(scene.totalRows) * pitch
        + double(scene.lanes.size()) * double(_cfg.trackSpacing)
        + double(_cfg.bottomMargin);

    const TimeRuler ruler(_cfg.rulerTicks, _cfg.timeUnit);
    scene.ticks = ruler.build(axis);
    return scene;
}
