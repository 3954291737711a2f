#include "TimeRuler.hpp"
#include "utils.hpp"
#include <algorithm>

TimeRuler::TimeRuler(int intervals, std::string unit)
    : _intervals{ std::max(1, intervals) }
    , _unit{ std::move(unit) }
{
}

std::string TimeRuler::formatLabel(double t) const
{
    if (_unit.empty()) return fmtNumber(t);
    return fmtNumber(t) + " " + _unit;
}

std::vector<TimeRuler::Tick> TimeRuler::build(const TimeAxis& axis) const
{
    const TimeRange& r = axis.range();
    std::vector<Tick> ticks;
    ticks.reserve(size_t(_intervals) + 1);

    for (int i = 0; i <= _intervals; ++i)
    {
        // last tick pinned to the range end (no accumulated rounding)
        const double t = (i == _intervals) ? r.end : r.start + r.span() * double(i) / double(_intervals);
        ticks.push_back({ t, axis.x(t), formatLabel(t) });
    }
    return ticks;
}
