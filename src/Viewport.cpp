#include "Viewport.hpp"
#include <algorithm>
#include <cmath>

Viewport::Viewport(double maxZoom)
    : _zoom{ 1.0 }
    , _offset{ 0.0 }
    , _maxZoom{ std::isfinite(maxZoom) ? std::max(1.0, maxZoom) : 1.0 }
{
}

void Viewport::clamp()
{
    _zoom = std::clamp(_zoom, 1.0, _maxZoom);
    _offset = std::clamp(_offset, 0.0, std::max(0.0, 1.0 - 1.0 / _zoom));
}

void Viewport::zoomAt(double factor, double cx)
{
    if (!(factor > 0.0) || !std::isfinite(factor)) return;
    cx = std::clamp(cx, 0.0, 1.0);

    const double tAtCursor = _offset + cx / _zoom;
    _zoom = std::clamp(_zoom * factor, 1.0, _maxZoom);
    _offset = tAtCursor - cx / _zoom;
    clamp();
}

void Viewport::panBy(double dx)
{
    _offset -= dx / _zoom;
    clamp();
}

void Viewport::centerOn(double n)
{
    _offset = n - 0.5 / _zoom;
    clamp();
}

void Viewport::fit()
{
    _zoom = 1.0;
    _offset = 0.0;
}

TimeRange Viewport::visible(const TimeRange& full) const
{
    const double span = full.span();
    return { full.start + normStart() * span, full.start + normEnd() * span };
}
