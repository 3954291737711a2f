#pragma once
#include <vector>
#include <string>
#include "model.hpp"

// Split CSV text into records (RFC 4180: quoted fields, "" escapes, quoted
// commas and newlines). firstLines receives the 1-based line each record
// starts on.
std::vector<std::vector<std::string>> split_csv(const std::string& text, std::vector<size_t>* firstLines = nullptr);

// Parse CSV rows "start,end,lane,label[,overhead[,color[,arg...]]]" into tasks.
// - invalid rows (< 4 fields, bad start/end, bad color) are skipped and
//   reported in diags with their line number
// - blank rows are ignored
// - label is resolved with format_label(label, args)
// Returns the number of rows skipped.
size_t parse_task_csv(const std::string& text, std::vector<Task>& out, std::vector<Diagnostic>* diags = nullptr);

// Parse a structured trace document back into tasks.
// - {"global_start":..,"global_end":..,"threads":[{"id":..,"tasks":[..]}]}
// - or [ {"start":..,"end":..,"thread":..,"args":..}, ... ]
// True in success (bad task objects are skipped into diags).
bool parse_task_json(const std::string& jsonText, std::vector<Task>& out, std::vector<Diagnostic>* diags = nullptr, std::string* outError = nullptr);

// Reads path and dispatches on the extension (".json" -> JSON, else CSV).
bool load_tasks(const std::string& path, std::vector<Task>& out, std::vector<Diagnostic>* diags = nullptr, std::string* outError = nullptr);

bool read_file(const std::string& path, std::string& out);
bool write_file(const std::string& path, const std::string& data);
