#include "config.hpp"
#include "parser.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string validate_layout_config(const LayoutConfig& cfg)
{
    if (cfg.widthPx <= 0.f) return "width_px must be positive";
    if (cfg.leftMargin < 0.f || cfg.rightMargin < 0.f) return "margins must not be negative";
    if (cfg.drawableWidth() <= 0.f) return "width_px must exceed left_margin + right_margin";
    if (cfg.rowHeight <= 0.f) return "row_height must be positive";
    if (cfg.rowPadding < 0.f || cfg.trackSpacing < 0.f) return "row_padding and track_spacing must not be negative";
    if (cfg.headerHeight < 0.f || cfg.bottomMargin < 0.f) return "header_height and bottom_margin must not be negative";
    if (cfg.minTaskWidth < 0.f) return "min_task_width must not be negative";
    if (cfg.labelMaxChars < 0) return "label_max_chars must not be negative";
    if (cfg.rulerTicks < 1) return "ruler_ticks must be at least 1";
    if (cfg.densityBins < 1) return "density_bins must be at least 1";
    if (!(cfg.maxZoom >= 1.f)) return "max_zoom must be at least 1";
    return {};
}

bool parse_layout_config(const std::string& jsonText, LayoutConfig& cfg, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }
    if (!root.is_object())
    {
        if (outError) *outError = "Config root must be an object";
        return false;
    }

    LayoutConfig c = cfg;
    try
    {
        c.widthPx = root.value("width_px", c.widthPx);
        c.leftMargin = root.value("left_margin", c.leftMargin);
        c.rightMargin = root.value("right_margin", c.rightMargin);
        c.rowHeight = root.value("row_height", c.rowHeight);
        c.rowPadding = root.value("row_padding", c.rowPadding);
        c.trackSpacing = root.value("track_spacing", c.trackSpacing);
        c.headerHeight = root.value("header_height", c.headerHeight);
        c.bottomMargin = root.value("bottom_margin", c.bottomMargin);
        c.minTaskWidth = root.value("min_task_width", c.minTaskWidth);
        c.labelMinWidth = root.value("label_min_width", c.labelMinWidth);
        c.labelMaxChars = root.value("label_max_chars", c.labelMaxChars);
        c.rulerTicks = root.value("ruler_ticks", c.rulerTicks);
        c.densityBins = root.value("density_bins", c.densityBins);
        c.maxZoom = root.value("max_zoom", c.maxZoom);
        c.timeUnit = root.value("time_unit", c.timeUnit);
    }
    catch (const json::exception& e)
    {
        // wrong value type for a known key
        if (outError) *outError = e.what();
        return false;
    }

    const std::string bad = validate_layout_config(c);
    if (!bad.empty())
    {
        if (outError) *outError = bad;
        return false;
    }
    cfg = c;
    return true;
}

bool load_layout_config(const std::string& path, LayoutConfig& cfg, std::string* outError)
{
    std::string data;
    if (!read_file(path, data))
    {
        if (outError) *outError = "Failed to open config " + path;
        return false;
    }
    return parse_layout_config(data, cfg, outError);
}
