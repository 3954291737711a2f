#pragma once
#include <string>
#include <vector>

#include "time_axis.hpp"

/// @brief TimeRuler — fixed number of evenly spaced labelled ticks over the global range.
class TimeRuler
{
public:
    /// @brief Tick — one labelled ruler mark.
    struct Tick
    {
        double time;        // absolute, input unit
        double x;
        std::string label;  // "<time> <unit>"
    };

    TimeRuler(int intervals, std::string unit);

    // intervals + 1 ticks, first at range.start, last at range.end
    std::vector<Tick> build(const TimeAxis& axis) const;

    // Label for a timestamp ("12.5 μs")
    std::string formatLabel(double t) const;

private:
    int _intervals;
    std::string _unit;
};
