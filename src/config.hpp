#pragma once
#include <string>

/// @brief LayoutConfig — every layout constant of the scene, in px unless noted.
struct LayoutConfig
{
    float widthPx = 1400.f;
    float leftMargin = 200.f;       // lane labels
    float rightMargin = 40.f;       // overflow (overhead fragments, last label)
    float rowHeight = 20.f;
    float rowPadding = 6.f;
    float trackSpacing = 12.f;      // extra gap after each lane
    float headerHeight = 40.f;      // ruler band
    float bottomMargin = 100.f;
    float minTaskWidth = 2.f;
    float labelMinWidth = 40.f;     // task text drawn only above this width
    int   labelMaxChars = 30;
    int   rulerTicks = 8;           // intervals, ticks drawn = rulerTicks + 1
    int   densityBins = 256;
    float maxZoom = 1e6f;           // viewer zoom limit, 1 = whole range
    std::string timeUnit = "\xCE\xBCs"; // "μs"

    float rowPitch() const { return rowHeight + rowPadding; }
    float drawableWidth() const { return widthPx - leftMargin - rightMargin; }
};

// Parse a JSON object of overrides into cfg (missing keys keep their value).
// True in success; on failure cfg is untouched and outError is filled.
bool parse_layout_config(const std::string& jsonText, LayoutConfig& cfg, std::string* outError = nullptr);
bool load_layout_config(const std::string& path, LayoutConfig& cfg, std::string* outError = nullptr);

// Empty string when the config is usable.
std::string validate_layout_config(const LayoutConfig& cfg);
