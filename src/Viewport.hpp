#pragma once
#include "model.hpp"

/// @brief Viewport — horizontal zoom/pan over the global range, same contract as the viewer script.
///
/// The visible window is [offset, offset + 1/zoom] in normalised time, with
/// zoom in [1, maxZoom] and offset clamped to [0, 1 - 1/zoom].
class Viewport
{
public:
    explicit Viewport(double maxZoom = 1e6);

    // Zoom by factor keeping the normalised cursor position cx ([0,1] of the content width) fixed.
    void zoomAt(double factor, double cx);
    // Drag by dx, a fraction of the content width (positive moves content right).
    void panBy(double dx);
    // Minimap click: center the window on normalised time n.
    void centerOn(double n);
    // Whole range visible.
    void fit();

    double zoom() const { return _zoom; }
    double offset() const { return _offset; }
    double normStart() const { return _offset; }
    double normEnd() const { return _offset + 1.0 / _zoom; }
    double maxZoom() const { return _maxZoom; }

    // window in absolute time
    TimeRange visible(const TimeRange& full) const;

private:
    void clamp();

    // how many "screens" fit in total
    double _zoom;
    // normalized left bound
    double _offset;
    double _maxZoom;
};
