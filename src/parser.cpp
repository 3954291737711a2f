#include "parser.hpp"
#include "label_format.hpp"
#include "color_helper.hpp"
#include "utils.hpp"
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool read_file(const std::string& path, std::string& out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream oss; oss << ifs.rdbuf();
    out = std::move(oss).str();
    return true;
}

bool write_file(const std::string& path, const std::string& data)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), std::streamsize(data.size()));
    return bool(ofs);
}

// ---------- CSV ----------
std::vector<std::vector<std::string>> split_csv(const std::string& text, std::vector<size_t>* firstLines)
{
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool quoted = false;
    bool rowHasData = false;
    size_t line = 1;
    size_t rowLine = 1;

    auto endField = [&]() { row.push_back(std::move(field)); field.clear(); rowHasData = true; };
    auto endRow = [&]()
        {
            if (rowHasData || !field.empty()) endField();
            rows.push_back(std::move(row));
            row.clear();
            if (firstLines) firstLines->push_back(rowLine);
            rowHasData = false;
        };

    // skip UTF-8 BOM
    size_t i = (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) ? 3 : 0;
    for (; i < text.size(); ++i)
    {
        const char c = text[i];
        if (quoted)
        {
            if (c == '"')
            {
                if (i + 1 < text.size() && text[i + 1] == '"') { field += '"'; ++i; }
                else quoted = false;
            }
            else
            {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }
        switch (c)
        {
            case '"': quoted = true; rowHasData = true; break;
            case ',': endField(); break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                [[fallthrough]];
            case '\n':
                endRow();
                ++line;
                rowLine = line;
                break;
            default: field += c; rowHasData = true; break;
        }
    }
    if (rowHasData || !field.empty()) endRow();
    return rows;
}

static bool parse_double(std::string_view s, double& out)
{
    s = trim(s);
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return false;
    double v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

static std::string join_row(const std::vector<std::string>& row)
{
    std::string s = "[";
    for (size_t i = 0; i < row.size(); ++i)
    {
        if (i) s += ", ";
        s += "'" + row[i] + "'";
    }
    return s + "]";
}

size_t parse_task_csv(const std::string& text, std::vector<Task>& out, std::vector<Diagnostic>* diags)
{
    std::vector<size_t> lines;
    const auto rows = split_csv(text, &lines);
    size_t skipped = 0;

    auto report = [&](size_t line, std::string msg)
        {
            ++skipped;
            if (diags) diags->push_back({ line, std::move(msg) });
        };

    for (size_t i = 0; i < rows.size(); ++i)
    {
        const auto& row = rows[i];
        const size_t line = lines[i];

        bool blank = true;
        for (const auto& c : row) if (!trim(c).empty()) { blank = false; break; }
        if (blank) continue;

        if (row.size() < 4)
        {
            report(line, "Skipping invalid line " + std::to_string(line) + ": " + join_row(row));
            continue;
        }

        Task t;
        if (!parse_double(row[0], t.start) || !parse_double(row[1], t.end))
        {
            report(line, "Bad times on line " + std::to_string(line) + ": ['" + row[0] + "', '" + row[1] + "']");
            continue;
        }
        t.lane = std::string(trim(row[2]));
        t.rawLabel = std::string(trim(row[3]));

        if (row.size() > 4)
        {
            double ov = 0;
            // non numeric or negative overhead -> absent
            if (parse_double(row[4], ov) && ov >= 0.0)
                t.overheadDuration = ov;
        }
        if (row.size() > 5)
        {
            const std::string_view raw = trim(row[5]);
            if (!raw.empty())
            {
                uint32_t c = 0;
                if (!color::parseColorToken(raw, c))
                {
                    report(line, "Bad color on line " + std::to_string(line) + ": '" + std::string(raw) + "'");
                    continue;
                }
                t.explicitColor = c;
            }
        }
        if (row.size() > 6)
        {
            const std::vector<std::string> cols(row.begin() + 6, row.end());
            t.args = split_label_args(cols);
        }

        t.label = format_label(t.rawLabel, t.args);
        t.sequenceIndex = i;
        out.push_back(std::move(t));
    }
    return skipped;
}

// ---------- JSON ----------
static void parse_task_object(const json& o, const std::string& laneId, size_t index, std::vector<Task>& out, std::vector<Diagnostic>* diags)
{
    auto report = [&](const std::string& msg)
        {
            if (diags) diags->push_back({ 0, "Skipping task #" + std::to_string(index) + ": " + msg });
        };

    if (!o.is_object()) { report("not an object"); return; }
    if (!o.contains("start") || !o["start"].is_number() || !o.contains("end") || !o["end"].is_number())
    {
        report("missing or non numeric start/end");
        return;
    }

    Task t;
    t.start = o["start"].get<double>();
    t.end = o["end"].get<double>();
    if (!std::isfinite(t.start) || !std::isfinite(t.end)) { report("non finite start/end"); return; }

    t.lane = laneId;
    if (t.lane.empty())
    {
        if (o.contains("thread") && o["thread"].is_string()) t.lane = o["thread"].get<std::string>();
        else if (o.contains("lane") && o["lane"].is_string()) t.lane = o["lane"].get<std::string>();
    }

    if (o.contains("args") && o["args"].is_string()) t.label = o["args"].get<std::string>();
    else if (o.contains("label") && o["label"].is_string()) t.label = o["label"].get<std::string>();
    t.rawLabel = t.label;

    if (o.contains("raw_args") && o["raw_args"].is_array())
    {
        for (const auto& a : o["raw_args"])
            t.args.push_back(a.is_string() ? a.get<std::string>() : a.dump());
    }

    if (o.contains("overhead_duration_us") && o["overhead_duration_us"].is_number())
    {
        const double ov = o["overhead_duration_us"].get<double>();
        if (ov >= 0.0) t.overheadDuration = ov;
    }

    if (o.contains("color") && !o["color"].is_null())
    {
        const json& c = o["color"];
        uint32_t v = 0;
        if (c.is_number_unsigned() && c.get<uint64_t>() <= 0xFFFFFFFFull) v = uint32_t(c.get<uint64_t>());
        else if (c.is_number_integer() && c.get<int64_t>() >= 0 && c.get<int64_t>() <= 0xFFFFFFFFll) v = uint32_t(c.get<int64_t>());
        else if (!(c.is_string() && color::parseColorToken(trim(c.get<std::string>()), v)))
        {
            report("invalid color " + c.dump());
            return;
        }
        t.explicitColor = v;
    }

    t.sequenceIndex = index;
    out.push_back(std::move(t));
}

bool parse_task_json(const std::string& jsonText, std::vector<Task>& out, std::vector<Diagnostic>* diags, std::string* outError)
{
    json root;
    try
    {
        root = json::parse(jsonText);
    }
    catch (const std::exception& e)
    {
        if (outError)
            *outError = e.what();
        return false;
    }

    size_t index = 0;

    // 1) {"threads":[{"id":..,"tasks":[...]}]}
    if (root.is_object() && root.contains("threads") && root["threads"].is_array())
    {
        for (const auto& th : root["threads"])
        {
            if (!th.is_object()) continue;
            std::string id;
            if (th.contains("id"))
                id = th["id"].is_string() ? th["id"].get<std::string>() : th["id"].dump();
            if (!th.contains("tasks") || !th["tasks"].is_array()) continue;
            for (const auto& it : th["tasks"])
                parse_task_object(it, id, index++, out, diags);
        }
        return true;
    }

    // 2) flat array of tasks
    if (root.is_array())
    {
        for (const auto& it : root)
            parse_task_object(it, std::string(), index++, out, diags);
        return true;
    }

    if (outError) *outError = "Unsupported JSON root";
    return false;
}

bool load_tasks(const std::string& path, std::vector<Task>& out, std::vector<Diagnostic>* diags, std::string* outError)
{
    std::string data;
    if (!read_file(path, data))
    {
        if (outError) *outError = "Failed to open file " + path;
        return false;
    }

    const bool isJson = path.size() >= 5 && path.compare(path.size() - 5, 5, ".json") == 0;
    if (isJson)
        return parse_task_json(data, out, diags, outError);

    parse_task_csv(data, out, diags);
    return true;
}
