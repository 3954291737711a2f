#pragma once
#include <vector>
#include <cstddef>

#include "model.hpp"

/// @brief LanePacking — result of packing one lane.
struct LanePacking
{
    // rows[i] is the row of the i-th input task
    std::vector<int> rows;
    // input indices in placement order: (start, end, sequenceIndex)
    std::vector<size_t> order;
    int rowCount = 0;
};

// Greedy interval partitioning. Tasks are placed in (start, end, sequenceIndex)
// order into the first row whose last end is <= task start, a new row is
// opened otherwise. Same-row tasks never overlap; the row count equals the
// maximum number of tasks active at one instant.
LanePacking pack_lane(const std::vector<const Task*>& lane);

// Packs then writes Task::row for every task of the lane.
int assign_rows(std::vector<Task*>& lane);
