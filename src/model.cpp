#include "model.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

TimeRange computeTimeRange(const std::vector<Task>& tasks)
{
    if (tasks.empty())
        return {0.0, 1.0};

    double tmin = std::numeric_limits<double>::max();
    double tmax = std::numeric_limits<double>::lowest();
    for (const auto& t : tasks)
    {
        tmin = std::min(tmin, t.start);
        tmax = std::max(tmax, t.end);
    }
    return {tmin, tmax};
}

TimeRange computeLayoutRange(const std::vector<Task>& tasks)
{
    return widenDegenerate(computeTimeRange(tasks));
}

TimeRange widenDegenerate(TimeRange r)
{
    if (!std::isfinite(r.start) || !std::isfinite(r.end))
        return {0.0, 1.0};
    if (r.end > r.start)
        return r;

    const double pad = std::max(kDegenerateRangePad, std::abs(r.start) * kDegenerateRangeRelPad);
    r.end = r.start + pad;
    // pad below the spacing of doubles at start
    if (!(r.end > r.start))
        r.end = std::nextafter(r.start, std::numeric_limits<double>::infinity());
    return r;
}
