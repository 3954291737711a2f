#include "html_renderer.hpp"

#include <numeric>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using ::testing::HasSubstr;
using ::testing::Not;

size_t CountOf(const std::string& text, const std::string& needle)
{
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) ++n;
    return n;
}

class HtmlRendererTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        tasks.push_back(MakeTask(0, 10, "T1", "load <cfg>", 0));
        tasks.push_back(MakeTask(5, 15, "T1", "parse", 1));
        tasks.push_back(MakeTask(20, 30, "T2", "write \"out\"", 2));
        tasks[0].overheadDuration = 3.0;
        scene = SceneBuilder{ LayoutConfig{} }.build(tasks);
    }

    static Task MakeTask(double start, double end, const std::string& lane, const std::string& label, size_t seq)
    {
        Task t;
        t.start = start;
        t.end = end;
        t.lane = lane;
        t.label = label;
        t.sequenceIndex = seq;
        return t;
    }

    std::vector<Task> tasks;
    Scene scene;
};

TEST_F(HtmlRendererTest, LaneIndexDescribesRowRanges)
{
    const nlohmann::json idx = build_lane_index(scene);

    EXPECT_EQ(idx["unit"], "\xCE\xBCs");
    ASSERT_EQ(idx["lanes"].size(), 2u);
    const auto& t1 = idx["lanes"][0];
    EXPECT_EQ(t1["lane"], "T1");
    EXPECT_EQ(t1["row_offset"], 0);
    EXPECT_EQ(t1["rows"], 2);
    EXPECT_EQ(t1["header_item"], 0);
    EXPECT_EQ(t1["items"], nlohmann::json::array({ 1, 2 }));
    EXPECT_DOUBLE_EQ(t1["y_top"].get<double>(), 40.0);
    EXPECT_DOUBLE_EQ(t1["y_bottom"].get<double>(), 92.0);

    const auto& t2 = idx["lanes"][1];
    EXPECT_EQ(t2["row_offset"], 2);
    EXPECT_EQ(t2["header_item"], 3);
    EXPECT_EQ(t2["items"], nlohmann::json::array({ 4 }));
}

TEST_F(HtmlRendererTest, SvgHasOneElementPerItem)
{
    const std::string svg = render_timeline_svg(scene);

    EXPECT_THAT(svg, HasSubstr("<svg id=\"timeline\" width=\"1400\" height=\"242\""));
    EXPECT_EQ(CountOf(svg, "class=\"task-item\""), 3u);
    EXPECT_EQ(CountOf(svg, "class=\"lane-header\""), 2u);
    EXPECT_EQ(CountOf(svg, "class=\"time-label\">"), 9u);
    EXPECT_EQ(CountOf(svg, "class=\"overhead\""), 1u);
    EXPECT_THAT(svg, HasSubstr("fill=\"#4CAF50\""));
    EXPECT_THAT(svg, HasSubstr(">0 \xCE\xBCs</text>"));
    EXPECT_THAT(svg, HasSubstr(">30 \xCE\xBCs</text>"));
    EXPECT_THAT(svg, HasSubstr("<tspan class=\"disclosure\">\xE2\x96\xBC</tspan> T1"));
}

TEST_F(HtmlRendererTest, TaskAttributesAreEscaped)
{
    const std::string svg = render_timeline_svg(scene);

    EXPECT_THAT(svg, HasSubstr("data-label=\"load &lt;cfg&gt;\""));
    EXPECT_THAT(svg, HasSubstr("data-label=\"write &quot;out&quot;\""));
    EXPECT_THAT(svg, Not(HasSubstr("<cfg>")));
    EXPECT_THAT(svg, HasSubstr("data-start=\"20\" data-end=\"30\""));
    EXPECT_THAT(svg, HasSubstr("data-overhead=\"3\""));
}

TEST_F(HtmlRendererTest, DocumentIsSelfContained)
{
    HtmlOptions opt;
    opt.title = "Run <1>";
    opt.sourceName = "trace.csv";
    const std::string html = render_timeline_html(scene, opt);

    EXPECT_EQ(html.rfind("<!doctype html>", 0), 0u);
    EXPECT_THAT(html, HasSubstr("<title>Run &lt;1&gt;</title>"));
    EXPECT_THAT(html, HasSubstr("id=\"btnCollapseAll\""));
    EXPECT_THAT(html, HasSubstr("id=\"btnExpandAll\""));
    EXPECT_THAT(html, HasSubstr("Time range: 0 \xCE\xBCs \xE2\x80\x94 30 \xCE\xBCs"));
    EXPECT_THAT(html, HasSubstr("File: trace.csv"));
    EXPECT_THAT(html, HasSubstr("<script type=\"application/json\" id=\"lane-index\">"));
    EXPECT_THAT(html, HasSubstr("id=\"tooltip\""));
    EXPECT_THAT(html, Not(HasSubstr("src=\"http")));
    EXPECT_THAT(html, Not(HasSubstr("<link")));
}

TEST_F(HtmlRendererTest, LaneIndexCarriesAxisAndDensity)
{
    const nlohmann::json idx = build_lane_index(scene);

    const auto& axis = idx["axis"];
    EXPECT_DOUBLE_EQ(axis["start"].get<double>(), 0.0);
    EXPECT_DOUBLE_EQ(axis["end"].get<double>(), 30.0);
    EXPECT_DOUBLE_EQ(axis["left"].get<double>(), 200.0);
    EXPECT_DOUBLE_EQ(axis["width"].get<double>(), 1160.0);
    EXPECT_DOUBLE_EQ(axis["min_width"].get<double>(), 2.0);
    EXPECT_DOUBLE_EQ(axis["label_min_width"].get<double>(), 40.0);
    EXPECT_DOUBLE_EQ(axis["max_zoom"].get<double>(), 1e6);

    const auto density = idx["density"].get<std::vector<uint32_t>>();
    ASSERT_EQ(density.size(), 256u);
    // lanes summed, long tasks mark both ends
    EXPECT_EQ(density[0], 1u);
    EXPECT_EQ(density[42], 1u);
    EXPECT_EQ(density[170], 1u);
    EXPECT_EQ(density[255], 1u);
    EXPECT_EQ(density[100], 0u);
    EXPECT_EQ(std::accumulate(density.begin(), density.end(), 0u), 6u);
}

TEST_F(HtmlRendererTest, TimeContentIsClippedToPlot)
{
    const std::string svg = render_timeline_svg(scene);

    EXPECT_THAT(svg, HasSubstr("<clipPath id=\"plot-clip\"><rect x=\"200\" y=\"0\" width=\"1200\" height=\"242\" /></clipPath>"));
    EXPECT_THAT(svg, HasSubstr("<g class=\"ruler\" clip-path=\"url(#plot-clip)\">"));
    EXPECT_EQ(CountOf(svg, "class=\"lane-tasks\" data-lane="), 2u);
    EXPECT_EQ(CountOf(svg, "clip-path=\"url(#plot-clip)\""), 3u);
    // lane labels stay outside the clip
    EXPECT_THAT(svg, Not(HasSubstr("<g class=\"lane-header\" data-lane=\"0\" data-item=\"0\" clip-path")));
}

TEST_F(HtmlRendererTest, ZoomControlsAndMinimap)
{
    const std::string html = render_timeline_html(scene);

    EXPECT_THAT(html, HasSubstr("id=\"btnZoomIn\""));
    EXPECT_THAT(html, HasSubstr("id=\"btnZoomOut\""));
    EXPECT_THAT(html, HasSubstr("id=\"btnFit\""));
    EXPECT_THAT(html, HasSubstr("<input id=\"zoomSlider\" type=\"range\" min=\"0\" max=\"19.93\""));
    EXPECT_THAT(html, HasSubstr("<span id=\"zoomValue\" class=\"legend\">1.00x</span>"));
    EXPECT_THAT(html, HasSubstr("<svg id=\"minimap\" width=\"1400\" height=\"36\""));
    EXPECT_EQ(CountOf(html, "class=\"minimap-density\""), 1u);
    EXPECT_THAT(html, HasSubstr("<rect id=\"minimap-window\" x=\"200\" y=\"0\" width=\"1160\""));
    EXPECT_THAT(html, HasSubstr("addEventListener('wheel'"));
}

TEST_F(HtmlRendererTest, ZoomLimitOfOneDisablesSlider)
{
    LayoutConfig cfg;
    cfg.maxZoom = 1.f;
    const Scene s = SceneBuilder{ cfg }.build(tasks);

    EXPECT_DOUBLE_EQ(build_lane_index(s)["axis"]["max_zoom"].get<double>(), 1.0);
    EXPECT_THAT(render_timeline_html(s), HasSubstr("min=\"0\" max=\"0\""));
}

TEST_F(HtmlRendererTest, LaneIndexCannotCloseScript)
{
    std::vector<Task> evil = { MakeTask(0, 1, "</script><b>", "x", 0) };
    const Scene s = SceneBuilder{ LayoutConfig{} }.build(evil);
    const std::string html = render_timeline_html(s);

    EXPECT_EQ(CountOf(html, "</script>"), 2u);
    EXPECT_THAT(html, HasSubstr("<\\/script><b>"));
}

}  // namespace
