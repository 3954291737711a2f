#include "html_renderer.hpp"
#include "color_helper.hpp"
#include "utils.hpp"
#include "Viewport.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace
{
    constexpr const char* kDisclosureExpanded = "\xE2\x96\xBC";   // ▼
    constexpr const char* kEmDash = "\xE2\x80\x94";               // —

    constexpr const char* kPageStyle = R"CSS(
body { font-family: Arial, Helvetica, sans-serif; margin: 8px; }
.header { margin-bottom: 8px; }
.legend { font-size: 12px; color: #444; }
.controls { margin-bottom: 8px; }
svg { border: 1px solid #ddd; background: #fff; }
#timeline { cursor: grab; }
.minimap { margin-top: 4px; }
#minimap { cursor: pointer; }
.tooltip {
  position: absolute;
  pointer-events: none;
  background: rgba(0,0,0,0.8);
  color: white; padding: 6px; border-radius: 4px; font-size: 12px;
  white-space: pre;
}
)CSS";

    constexpr const char* kSvgStyle = R"CSS(
      .lane-label { font-size:12px; fill:#111; font-weight:bold; cursor:pointer; user-select:none; }
      .time-label { font-size:11px; fill:#666; }
      .task-label { font-size:11px; fill:#111; pointer-events:none; }
      .task-rect { stroke: rgba(0,0,0,0.08); stroke-width: 1; }
      .overhead { pointer-events:none; }
      .sparkline { fill:none; stroke-width:1; pointer-events:none; }
)CSS";

    // Collapse/expand works only from the lane index (no geometry or text scan).
    // Zoom/pan reads the axis block of the same index.
    constexpr const char* kViewerScript = R"JS(
(function(){
  const svg = document.getElementById('timeline');
  const tooltip = document.getElementById('tooltip');
  const index = JSON.parse(document.getElementById('lane-index').textContent);
  const unit = index.unit || '';

  const itemNodes = new Map();
  for (const n of svg.querySelectorAll('.task-item')) itemNodes.set(Number(n.getAttribute('data-item')), n);

  // false = expanded (initial), true = collapsed
  const collapsed = index.lanes.map(() => false);

  function setLane(i, value) {
    const lane = index.lanes[i];
    if (!lane) return;
    collapsed[i] = value;
    for (const id of lane.items) {
      const n = itemNodes.get(id);
      if (n) n.style.display = value ? 'none' : '';
    }
    const glyph = svg.querySelector('.lane-label[data-lane="' + i + '"] .disclosure');
    if (glyph) glyph.textContent = value ? '▶' : '▼';
    const spark = svg.querySelector('.sparkline[data-lane="' + i + '"]');
    if (spark) spark.style.display = value ? '' : 'none';
    if (value) tooltip.style.display = 'none';
  }

  function toggleLane(i) { setLane(i, !collapsed[i]); }

  window.toggleLane = toggleLane;
  window.collapseAll = function(value) {
    for (let i = 0; i < collapsed.length; ++i) setLane(i, !!value);
  };
  window.laneState = function(i) { return collapsed[i] ? 'collapsed' : 'expanded'; };

  for (const t of svg.querySelectorAll('.lane-label')) {
    t.addEventListener('click', () => toggleLane(Number(t.getAttribute('data-lane'))));
  }
  const btnCollapse = document.getElementById('btnCollapseAll');
  const btnExpand = document.getElementById('btnExpandAll');
  if (btnCollapse) btnCollapse.addEventListener('click', () => window.collapseAll(true));
  if (btnExpand) btnExpand.addEventListener('click', () => window.collapseAll(false));

  function showTooltip(ev) {
    const target = ev.target;
    if (target && target.classList && target.classList.contains('task')) {
      const label = target.getAttribute('data-label') || '';
      const start = target.getAttribute('data-start');
      const end = target.getAttribute('data-end');
      tooltip.textContent = label + '\n' + start + ' - ' + end + (unit ? ' ' + unit : '');
      tooltip.style.display = 'block';
      const wrap = svg.parentNode.getBoundingClientRect();
      tooltip.style.left = (ev.clientX - wrap.left + 12) + 'px';
      tooltip.style.top = (ev.clientY - wrap.top + 12) + 'px';
    } else {
      tooltip.style.display = 'none';
    }
  }
  svg.addEventListener('mouseover', showTooltip);
  svg.addEventListener('mousemove', showTooltip);
  svg.addEventListener('mouseleave', function(){ tooltip.style.display = 'none'; });

  // Horizontal zoom/pan. Window = [offset, offset + 1/zoom] of the global range.
  const axis = index.axis;
  const fullSpan = axis.end - axis.start;
  const maxZoom = Math.max(1, axis.max_zoom || 1);
  const view = { zoom: 1, offset: 0 };

  const tasks = Array.from(svg.querySelectorAll('rect.task')).map(r => ({
    rect: r,
    start: Number(r.getAttribute('data-start')),
    end: Number(r.getAttribute('data-end')),
    overhead: r.hasAttribute('data-overhead') ? Number(r.getAttribute('data-overhead')) : 0,
    ov: r.parentNode.querySelector('.overhead'),
    label: r.parentNode.querySelector('.task-label'),
  }));
  const rulerLines = Array.from(svg.querySelectorAll('g.ruler line'));
  const rulerTexts = Array.from(svg.querySelectorAll('g.ruler text'));
  const miniWindow = document.getElementById('minimap-window');
  const slider = document.getElementById('zoomSlider');
  const zoomValue = document.getElementById('zoomValue');

  function clampView() {
    view.zoom = Math.min(Math.max(view.zoom, 1), maxZoom);
    view.offset = Math.min(Math.max(view.offset, 0), Math.max(0, 1 - 1 / view.zoom));
  }
  function xOf(t) { return axis.left + ((t - axis.start) / fullSpan - view.offset) * view.zoom * axis.width; }
  function tOf(n) { return axis.start + (view.offset + n / view.zoom) * fullSpan; }

  function applyView() {
    const pxPerUnit = view.zoom * axis.width / fullSpan;
    for (const t of tasks) {
      const x = xOf(t.start);
      const w = Math.max(axis.min_width, (t.end - t.start) * pxPerUnit);
      t.rect.setAttribute('x', x.toFixed(2));
      t.rect.setAttribute('width', w.toFixed(2));
      if (t.ov) {
        t.ov.setAttribute('x', xOf(t.end).toFixed(2));
        t.ov.setAttribute('width', Math.max(0, t.overhead * pxPerUnit).toFixed(2));
      }
      if (t.label) {
        t.label.setAttribute('x', (x + 4).toFixed(2));
        t.label.style.display = w > axis.label_min_width ? '' : 'none';
      }
    }
    const n = rulerTexts.length - 1;
    for (let i = 0; i < rulerTexts.length; ++i) {
      // tick positions stay put, their times follow the window
      const t = n > 0 ? tOf(i / n) : tOf(0);
      rulerTexts[i].textContent = String(Number(t.toPrecision(12))) + (unit ? ' ' + unit : '');
    }
    if (miniWindow) {
      miniWindow.setAttribute('x', (axis.left + view.offset * axis.width).toFixed(2));
      miniWindow.setAttribute('width', Math.max(2, axis.width / view.zoom).toFixed(2));
    }
    if (slider) slider.value = String(Math.log2(view.zoom));
    if (zoomValue) zoomValue.textContent = view.zoom.toFixed(2) + 'x';
  }

  function zoomAt(factor, cx) {
    if (!(factor > 0) || !isFinite(factor)) return;
    cx = Math.min(Math.max(cx, 0), 1);
    const tAtCursor = view.offset + cx / view.zoom;
    view.zoom = Math.min(Math.max(view.zoom * factor, 1), maxZoom);
    view.offset = tAtCursor - cx / view.zoom;
    clampView();
    applyView();
  }
  function panBy(dx) { view.offset -= dx / view.zoom; clampView(); applyView(); }
  function centerOn(nt) { view.offset = nt - 0.5 / view.zoom; clampView(); applyView(); }
  function fit() { view.zoom = 1; view.offset = 0; applyView(); }

  function cursorX(ev) {
    const box = svg.getBoundingClientRect();
    return (ev.clientX - box.left - axis.left) / axis.width;
  }

  svg.addEventListener('wheel', function(ev) {
    ev.preventDefault();
    zoomAt(ev.deltaY < 0 ? 1.12 : 1 / 1.12, cursorX(ev));
  }, { passive: false });

  let drag = null;
  svg.addEventListener('mousedown', function(ev) {
    if (ev.button !== 0 || (ev.target.closest && ev.target.closest('.lane-label'))) return;
    drag = { x: ev.clientX };
    svg.style.cursor = 'grabbing';
  });
  window.addEventListener('mousemove', function(ev) {
    if (!drag) return;
    const dx = (ev.clientX - drag.x) / axis.width;
    drag.x = ev.clientX;
    panBy(dx);
  });
  window.addEventListener('mouseup', function() {
    if (!drag) return;
    drag = null;
    svg.style.cursor = '';
  });

  if (slider) slider.addEventListener('input', () => zoomAt(Math.pow(2, Number(slider.value)) / view.zoom, 0.5));
  const btnZoomIn = document.getElementById('btnZoomIn');
  const btnZoomOut = document.getElementById('btnZoomOut');
  const btnFit = document.getElementById('btnFit');
  if (btnZoomIn) btnZoomIn.addEventListener('click', () => zoomAt(1.5, 0.5));
  if (btnZoomOut) btnZoomOut.addEventListener('click', () => zoomAt(1 / 1.5, 0.5));
  if (btnFit) btnFit.addEventListener('click', fit);

  const minimap = document.getElementById('minimap');
  if (minimap) minimap.addEventListener('click', function(ev) {
    const box = minimap.getBoundingClientRect();
    centerOn((ev.clientX - box.left - axis.left) / axis.width);
  });

  window.zoomAt = zoomAt;
  window.viewState = function() { return { zoom: view.zoom, offset: view.offset }; };
})();
)JS";

    // "</script>" inside the JSON island would end the element
    std::string scriptSafe(std::string s)
    {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] == '<' && i + 1 < s.size() && s[i + 1] == '/')
            {
                out += "<\\/";
                ++i;
                continue;
            }
            out += s[i];
        }
        return out;
    }

    std::string sparklinePoints(const Scene& scene, const LaneBlock& b)
    {
        const LayoutConfig& cfg = scene.cfg;
        if (b.densityBins.empty()) return {};
        const uint32_t peak = *std::max_element(b.densityBins.begin(), b.densityBins.end());
        const double bottom = b.yTop + cfg.rowPitch() - 2.0;
        const double height = std::max(1.0, double(cfg.rowPitch()) - 4.0);
        const double binW = double(cfg.drawableWidth()) / double(b.densityBins.size());

        std::string pts;
        for (size_t i = 0; i < b.densityBins.size(); ++i)
        {
            const double v = peak ? double(b.densityBins[i]) / double(peak) : 0.0;
            const double x = double(cfg.leftMargin) + (double(i) + 0.5) * binW;
            const double y = bottom - v * height;
            if (i) pts += ' ';
            pts += fmtPx(x) + "," + fmtPx(y);
        }
        return pts;
    }

    // all lanes summed, the minimap profile
    std::vector<uint32_t> totalDensity(const Scene& scene)
    {
        std::vector<uint32_t> total;
        for (const LaneBlock& b : scene.lanes)
        {
            if (total.size() < b.densityBins.size()) total.resize(b.densityBins.size(), 0);
            for (size_t i = 0; i < b.densityBins.size(); ++i) total[i] += b.densityBins[i];
        }
        return total;
    }

    std::string minimapSvg(const Scene& scene)
    {
        const LayoutConfig& cfg = scene.cfg;
        constexpr double kHeight = 36.0;
        const std::vector<uint32_t> bins = totalDensity(scene);

        std::ostringstream os;
        os << "<svg id=\"minimap\" width=\"" << fmtPx(scene.width) << "\" height=\"" << fmtPx(kHeight)
           << "\" xmlns=\"http://www.w3.org/2000/svg\">";
        os << "<rect x=\"" << fmtPx(cfg.leftMargin) << "\" y=\"0\" width=\"" << fmtPx(cfg.drawableWidth())
           << "\" height=\"" << fmtPx(kHeight) << "\" fill=\"" << color::kHeaderBg << "\" />";
        if (!bins.empty())
        {
            const uint32_t peak = *std::max_element(bins.begin(), bins.end());
            const double binW = double(cfg.drawableWidth()) / double(bins.size());
            os << "<polyline class=\"minimap-density\" fill=\"none\" stroke=\"" << color::kSparkline << "\" points=\"";
            for (size_t i = 0; i < bins.size(); ++i)
            {
                const double v = peak ? double(bins[i]) / double(peak) : 0.0;
                if (i) os << ' ';
                os << fmtPx(double(cfg.leftMargin) + (double(i) + 0.5) * binW) << "," << fmtPx(kHeight - 2.0 - v * (kHeight - 4.0));
            }
            os << "\" />";
        }
        os << "<rect id=\"minimap-window\" x=\"" << fmtPx(cfg.leftMargin) << "\" y=\"0\" width=\""
           << fmtPx(cfg.drawableWidth()) << "\" height=\"" << fmtPx(kHeight) << "\" fill=\"" << color::kViewWindow
           << "\" fill-opacity=\"0.15\" stroke=\"" << color::kViewWindow << "\" />";
        os << "</svg>";
        return os.str();
    }

    void writeTask(std::ostringstream& os, const SceneItem& it)
    {
        os << "<g class=\"task-item\" data-item=\"" << it.id << "\" data-lane=\"" << it.laneIndex << "\">";
        os << "<rect class=\"task-rect task\" x=\"" << fmtPx(it.x) << "\" y=\"" << fmtPx(it.y)
           << "\" width=\"" << fmtPx(it.w) << "\" height=\"" << fmtPx(it.h)
           << "\" rx=\"3\" ry=\"3\" fill=\"" << it.fill
           << "\" data-item=\"" << it.id
           << "\" data-lane=\"" << escapeXml(it.lane)
           << "\" data-row=\"" << it.row
           << "\" data-start=\"" << fmtNumber(it.start)
           << "\" data-end=\"" << fmtNumber(it.end)
           << "\" data-label=\"" << escapeXml(it.label) << "\"";
        if (it.task && it.task->overheadDuration)
            os << " data-overhead=\"" << fmtNumber(*it.task->overheadDuration) << "\"";
        os << " />";

        if (it.hasOverhead)
        {
            // inset fragment after the task end
            os << "<rect class=\"overhead\" x=\"" << fmtPx(it.ovX) << "\" y=\"" << fmtPx(it.y + it.h * 0.25)
               << "\" width=\"" << fmtPx(it.ovW) << "\" height=\"" << fmtPx(it.h * 0.5)
               << "\" fill=\"" << color::kOverhead << "\" />";
        }
        if (!it.text.empty())
        {
            os << "<text class=\"task-label\" x=\"" << fmtPx(it.x + 4) << "\" y=\"" << fmtPx(it.y + it.h * 0.7)
               << "\">" << escapeXml(it.text) << "</text>";
        }
        os << "</g>\n";
    }
}

json build_lane_index(const Scene& scene)
{
    json lanes = json::array();
    for (const LaneBlock& b : scene.lanes)
    {
        lanes.push_back({
            { "lane", b.lane },
            { "index", b.laneIndex },
            { "row_offset", b.rowOffset },
            { "rows", b.rowCount },
            { "y_top", b.yTop },
            { "y_bottom", b.yBottom },
            { "header_item", b.headerItem },
            { "items", b.taskItems },
        });
    }
    const LayoutConfig& cfg = scene.cfg;
    const Viewport view{ cfg.maxZoom };
    json axis = {
        { "start", scene.range.start },
        { "end", scene.range.end },
        { "left", cfg.leftMargin },
        { "width", cfg.drawableWidth() },
        { "min_width", cfg.minTaskWidth },
        { "label_min_width", cfg.labelMinWidth },
        { "max_zoom", view.maxZoom() },
    };
    return json{
        { "unit", cfg.timeUnit },
        { "axis", std::move(axis) },
        { "density", totalDensity(scene) },
        { "lanes", std::move(lanes) },
    };
}

std::string render_timeline_svg(const Scene& scene)
{
    const LayoutConfig& cfg = scene.cfg;
    std::ostringstream os;

    os << "<svg id=\"timeline\" width=\"" << fmtPx(scene.width) << "\" height=\"" << fmtPx(scene.height)
       << "\" xmlns=\"http://www.w3.org/2000/svg\">\n";
    os << "  <defs>\n    <style type=\"text/css\"><![CDATA[" << kSvgStyle << "    ]]></style>\n";
    // time dependent content stays right of the lane labels when zoomed
    os << "    <clipPath id=\"plot-clip\"><rect x=\"" << fmtPx(cfg.leftMargin) << "\" y=\"0\" width=\""
       << fmtPx(cfg.widthPx - cfg.leftMargin) << "\" height=\"" << fmtPx(scene.height) << "\" /></clipPath>\n  </defs>\n";

    // ruler
    os << "<g class=\"ruler\" clip-path=\"url(#plot-clip)\">\n";
    for (const auto& tk : scene.ticks)
    {
        os << "<line x1=\"" << fmtPx(tk.x) << "\" y1=\"0\" x2=\"" << fmtPx(tk.x) << "\" y2=\""
           << fmtPx(cfg.headerHeight - 6.0) << "\" stroke=\"" << color::kRulerLine << "\" />";
        os << "<text x=\"" << fmtPx(tk.x + 3) << "\" y=\"" << fmtPx(cfg.headerHeight - 10.0)
           << "\" class=\"time-label\">" << escapeXml(tk.label) << "</text>\n";
    }
    os << "</g>\n";

    for (const LaneBlock& b : scene.lanes)
    {
        const SceneItem& h = scene.items[b.headerItem];
        os << "<g class=\"lane-header\" data-lane=\"" << b.laneIndex << "\" data-item=\"" << h.id << "\">";
        os << "<rect x=\"" << fmtPx(h.x) << "\" y=\"" << fmtPx(h.y) << "\" width=\"" << fmtPx(h.w)
           << "\" height=\"" << fmtPx(h.h) << "\" fill=\"" << h.fill << "\" />";
        os << "<text class=\"lane-label\" data-lane=\"" << b.laneIndex << "\" x=\"8\" y=\"" << fmtPx(h.y + h.h / 1.8)
           << "\"><tspan class=\"disclosure\">" << kDisclosureExpanded << "</tspan> " << escapeXml(b.lane) << "</text>";
        os << "<polyline class=\"sparkline\" data-lane=\"" << b.laneIndex << "\" style=\"display:none\" stroke=\""
           << color::kSparkline << "\" points=\"" << sparklinePoints(scene, b) << "\" />";
        os << "</g>\n";

        os << "<g class=\"lane-tasks\" data-lane=\"" << b.laneIndex << "\" clip-path=\"url(#plot-clip)\">\n";
        for (size_t id : b.taskItems)
            writeTask(os, scene.items[id]);
        os << "</g>\n";
    }

    os << "</svg>";
    return os.str();
}

std::string render_timeline_html(const Scene& scene, const HtmlOptions& opt)
{
    const std::string unit = scene.cfg.timeUnit.empty() ? std::string() : " " + escapeXml(scene.cfg.timeUnit);
    const std::string laneIndex = scriptSafe(build_lane_index(scene).dump(-1, ' ', false, json::error_handler_t::replace));

    std::ostringstream os;
    os << "<!doctype html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
       << "<title>" << escapeXml(opt.title) << "</title>\n"
       << "<style>" << kPageStyle << "</style>\n</head>\n<body>\n";

    os << "<div class=\"header\">\n  <div class=\"controls\">\n"
       << "    <button id=\"btnCollapseAll\">Collapse all</button>\n"
       << "    <button id=\"btnExpandAll\">Expand all</button>\n"
       << "    &nbsp;|&nbsp;\n"
       << "    <button id=\"btnZoomOut\">-</button>\n"
       << "    <input id=\"zoomSlider\" type=\"range\" min=\"0\" max=\"" << fmtPx(std::log2(Viewport{ scene.cfg.maxZoom }.maxZoom()))
       << "\" step=\"0.01\" value=\"0\">\n"
       << "    <button id=\"btnZoomIn\">+</button>\n"
       << "    <button id=\"btnFit\">Fit</button>\n"
       << "    <span id=\"zoomValue\" class=\"legend\">1.00x</span>\n"
       << "    &nbsp;|&nbsp;\n"
       << "    <span class=\"legend\">Time range: " << fmtNumber(scene.range.start) << unit << " " << kEmDash << " "
       << fmtNumber(scene.range.end) << unit << "</span>\n  </div>\n"
       << "  <div>File: " << escapeXml(opt.sourceName) << "</div>\n</div>\n";

    os << "<div id=\"svgwrap\" style=\"position:relative;\">\n"
       << render_timeline_svg(scene) << "\n"
       << "<div id=\"tooltip\" class=\"tooltip\" style=\"display:none;\"></div>\n</div>\n"
       << "<div class=\"minimap\">" << minimapSvg(scene) << "</div>\n";

    os << "<script type=\"application/json\" id=\"lane-index\">" << laneIndex << "</script>\n";
    os << "<script>" << kViewerScript << "</script>\n</body>\n</html>\n";
    return os.str();
}
