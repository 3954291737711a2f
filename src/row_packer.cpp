#include "row_packer.hpp"
#include <algorithm>
#include <numeric>

LanePacking pack_lane(const std::vector<const Task*>& lane)
{
    LanePacking out;
    out.rows.assign(lane.size(), -1);
    out.order.resize(lane.size());
    std::iota(out.order.begin(), out.order.end(), size_t{ 0 });

    std::sort(out.order.begin(), out.order.end(), [&](size_t a, size_t b)
        {
            const Task& ta = *lane[a];
            const Task& tb = *lane[b];
            if (ta.start != tb.start) return ta.start < tb.start;
            if (ta.end != tb.end) return ta.end < tb.end;
            if (ta.sequenceIndex != tb.sequenceIndex) return ta.sequenceIndex < tb.sequenceIndex;
            return a < b;
        });

    // end time of the last task placed in each row
    std::vector<double> rowEnd;
    for (size_t idx : out.order)
    {
        const Task& t = *lane[idx];
        bool placed = false;
        for (size_t r = 0; r < rowEnd.size(); ++r)
        {
            if (rowEnd[r] <= t.start)
            {
                rowEnd[r] = t.end;
                out.rows[idx] = int(r);
                placed = true;
                break;
            }
        }
        if (!placed)
        {
            rowEnd.push_back(t.end);
            out.rows[idx] = int(rowEnd.size() - 1);
        }
    }
    out.rowCount = int(rowEnd.size());
    return out;
}

int assign_rows(std::vector<Task*>& lane)
{
    std::vector<const Task*> view(lane.begin(), lane.end());
    const LanePacking p = pack_lane(view);
    for (size_t i = 0; i < lane.size(); ++i)
        lane[i]->row = p.rows[i];
    return p.rowCount;
}
