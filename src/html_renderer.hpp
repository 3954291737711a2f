#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "SceneBuilder.hpp"

/// @brief HtmlOptions — document level text.
struct HtmlOptions
{
    std::string title = "Timeline";
    std::string sourceName = "input";   // shown under the controls
};

// Lane -> row range index consumed by the viewer script:
// { "unit": .., "lanes": [ { "lane", "index", "row_offset", "rows",
//                            "y_top", "y_bottom", "header_item", "items": [..] } ] }
nlohmann::json build_lane_index(const Scene& scene);

// Self-contained HTML: inline SVG scene, lane index, collapse/expand and
// tooltip script. No external resources.
std::string render_timeline_html(const Scene& scene, const HtmlOptions& opt = {});

// SVG part only (ruler, lane headers, tasks), used by render_timeline_html().
std::string render_timeline_svg(const Scene& scene);
