#pragma once
#include "model.hpp"
#include "config.hpp"

/// @brief TimeAxis — affine map from the global time range to [leftPad, leftPad + contentW].
class TimeAxis
{
public:
    // degenerate ranges are widened, see widenDegenerate()
    TimeAxis(const TimeRange& range, float leftPad, float contentW);
    TimeAxis(const TimeRange& range, const LayoutConfig& cfg);

    // x screen from absolute time
    double x(double t) const;
    // inverse of x()
    double timeAt(double px) const;
    // rectangle width, floored so short tasks stay visible
    double width(double start, double end, double minWidth) const;

    const TimeRange& range() const { return _range; }
    float leftPad() const { return _leftPad; }
    float contentW() const { return _contentW; }

private:
    TimeRange _range;
    float _leftPad;
    float _contentW;
    // precomputed contentW / span
    double _pxPerUnit;
};
