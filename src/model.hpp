#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <optional>

// =============== Task ===============
// one input row: start,end,lane,label[,overhead[,color[,args...]]]
// + pass-local fields (row/resolvedColor) attached while rendering.
struct Task
{
    double      start = 0.0;            // same unit across the whole input
    double      end = 0.0;              // end < start is kept (degenerate width)
    std::string lane;                   // thread / lane id
    std::string label;                  // resolved (arguments substituted)
    std::string rawLabel;               // template as read
    std::vector<std::string> args;      // auxiliary arguments
    std::optional<double>   overheadDuration;
    std::optional<uint32_t> explicitColor;
    size_t      sequenceIndex = 0;      // ingestion order (0-based line index)

// ---- internal ----
    int         row = -1;               // row inside the lane, -1 until packed
    std::string resolvedColor;          // "hsl(H S% L%)"

    double duration() const { return end - start; }
};

// =============== Diagnostics ===============
// record-level problem, the record was skipped (or a field defaulted)
struct Diagnostic
{
    size_t      line = 0;               // 1-based input line, 0 when not line bound
    std::string message;
};

// =============== Time range ===============
struct TimeRange
{
    double start = 0.0;
    double end = 1.0;

    double span() const { return end - start; }
};

// Minimum pad applied when every task shares the same instant.
inline constexpr double kDegenerateRangePad = 1.0;
// Pad relative to |start|, so large timestamps (ns since epoch) still widen.
inline constexpr double kDegenerateRangeRelPad = 1e-9;

// r unchanged when end > start, else end moved to start + pad with
// pad = max(kDegenerateRangePad, |start| * kDegenerateRangeRelPad).
// Non finite bounds give [0,1].
TimeRange widenDegenerate(TimeRange r);

// [min start, max end] over all tasks. Empty input gives [0,1].
TimeRange computeTimeRange(const std::vector<Task>& tasks);
// same, through widenDegenerate()
TimeRange computeLayoutRange(const std::vector<Task>& tasks);
