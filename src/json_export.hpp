#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "model.hpp"

// Structured document:
// {
//   "global_start": .., "global_end": ..,
//   "threads": [ { "id": lane, "tasks": [ {start, end, args, overhead_duration_us,
//                                          color, resolved_color[, raw_args]} ] } ]
// }
// Lanes sorted by id, tasks kept in ingestion order. No layout data.
nlohmann::ordered_json build_trace_document(const std::vector<Task>& tasks);

std::string render_trace_json(const std::vector<Task>& tasks, int indent = 2);
