#include "json_export.hpp"
#include "color_helper.hpp"
#include <map>

using ojson = nlohmann::ordered_json;

static ojson task_to_json(const Task& t)
{
    ojson o;
    o["start"] = t.start;
    o["end"] = t.end;
    o["args"] = t.label;
    o["overhead_duration_us"] = t.overheadDuration ? ojson(*t.overheadDuration) : ojson(nullptr);
    o["color"] = t.explicitColor ? ojson(*t.explicitColor) : ojson(nullptr);
    o["resolved_color"] = t.resolvedColor.empty() ? color::resolveCss(t) : t.resolvedColor;
    if (!t.args.empty())
        o["raw_args"] = t.args;
    return o;
}

ojson build_trace_document(const std::vector<Task>& tasks)
{
    const TimeRange r = computeTimeRange(tasks);

    std::map<std::string, std::vector<const Task*>> byLane;
    for (const Task& t : tasks) byLane[t.lane].push_back(&t);

    ojson threads = ojson::array();
    for (const auto& [lane, list] : byLane)
    {
        ojson th;
        th["id"] = lane;
        ojson arr = ojson::array();
        for (const Task* t : list) arr.push_back(task_to_json(*t));
        th["tasks"] = std::move(arr);
        threads.push_back(std::move(th));
    }

    ojson doc;
    doc["global_start"] = r.start;
    doc["global_end"] = r.end;
    doc["threads"] = std::move(threads);
    return doc;
}

std::string render_trace_json(const std::vector<Task>& tasks, int indent)
{
    // keep non-ASCII labels as UTF-8, replace invalid bytes instead of throwing
    return build_trace_document(tasks).dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}
