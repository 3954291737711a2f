#include "time_axis.hpp"
#include <algorithm>

TimeAxis::TimeAxis(const TimeRange& range, float leftPad, float contentW)
    : _range{ widenDegenerate(range) }
    , _leftPad{ leftPad }
    , _contentW{ contentW }
    , _pxPerUnit{ 0.0 }
{
    _pxPerUnit = double(_contentW) / _range.span();
}

TimeAxis::TimeAxis(const TimeRange& range, const LayoutConfig& cfg)
    : TimeAxis(range, cfg.leftMargin, cfg.drawableWidth())
{
}

double TimeAxis::x(double t) const
{
    // normalised [0..1] inside the range
    const double tn = (t - _range.start) / _range.span();
    return double(_leftPad) + tn * double(_contentW);
}

double TimeAxis::timeAt(double px) const
{
    return _range.start + (px - double(_leftPad)) / _pxPerUnit;
}

double TimeAxis::width(double start, double end, double minWidth) const
{
    return std::max(minWidth, x(end) - x(start));
}
