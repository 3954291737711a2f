#include "TimelineApp.hpp"
#include "parser.hpp"
#include "SceneBuilder.hpp"
#include "html_renderer.hpp"
#include "json_export.hpp"
#include <filesystem>
#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

TimelineApp::TimelineApp(std::ostream& out, std::ostream& err)
    : _out{ out }, _err{ err }
    , _tasks{}, _diagnostics{}, _reported{ 0 }
    , _cfg{}, _filter{}
    , _lastError{}, _writtenPath{}
{
}

void TimelineApp::flushDiagnostics()
{
    for (; _reported < _diagnostics.size(); ++_reported)
        _err << _diagnostics[_reported].message << "\n";
}

bool TimelineApp::loadFile(const std::string& path)
{
    if (path.empty())
    {
        _lastError = "No input file";
        return false;
    }

    std::vector<Task> newTasks;
    std::string err;
    const bool ok = load_tasks(path, newTasks, &_diagnostics, &err);
    flushDiagnostics();
    if (!ok)
    {
        _lastError = err.empty() ? "Failed to parse file" : err;
        return false;
    }
    _tasks.swap(newTasks);
    _lastError.clear();
    return true;
}

bool TimelineApp::applyOptions(const Options& opt)
{
    if (!opt.configPath.empty())
    {
        std::string err;
        if (!load_layout_config(opt.configPath, _cfg, &err))
        {
            _lastError = "Invalid config " + opt.configPath + ": " + err;
            return false;
        }
    }
    if (opt.timeUnit)
        _cfg.timeUnit = *opt.timeUnit;

    std::string err;
    if (!_filter.compile(opt.filter, opt.filterCaseSensitive, opt.filterRegex, &err))
    {
        _lastError = err;
        return false;
    }
    _filter.min_duration = opt.minDuration;
    return true;
}

std::string TimelineApp::writeHtml(const Options& opt)
{
    const std::string outPath = opt.outputPath.empty() ? kDefaultHtmlOutput : opt.outputPath;

    const SceneBuilder builder(_cfg);
    const Scene scene = builder.build(_tasks);

    HtmlOptions html;
    html.title = opt.title;
    html.sourceName = fs::path(opt.inputPath).filename().string();

    if (!write_file(outPath, render_timeline_html(scene, html)))
    {
        _lastError = "Failed to write " + outPath;
        return {};
    }
    return outPath;
}

std::string TimelineApp::writeJson(const Options& opt)
{
    const fs::path dir = opt.outputPath.empty() ? fs::path(kDefaultJsonDir) : fs::path(opt.outputPath);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        _lastError = "Failed to create " + dir.string() + ": " + ec.message();
        return {};
    }

    const std::string outPath = (dir / kJsonFileName).string();
    if (!write_file(outPath, render_trace_json(_tasks) + "\n"))
    {
        _lastError = "Failed to write " + outPath;
        return {};
    }
    return outPath;
}

std::string TimelineApp::render(const Options& opt)
{
    _writtenPath.clear();
    if (_tasks.empty())
        return {};
    _writtenPath = (opt.mode == OutputMode::Json) ? writeJson(opt) : writeHtml(opt);
    return _writtenPath;
}

int TimelineApp::run(const Options& opt)
{
    if (!applyOptions(opt))
    {
        _err << "Error: " << _lastError << "\n";
        return 1;
    }
    if (!loadFile(opt.inputPath))
    {
        _err << "Error: " << _lastError << "\n";
        return 1;
    }

    const size_t removed = _filter.apply(_tasks);
    if (removed)
        _err << "Filtered out " << removed << " task(s)\n";

    if (_tasks.empty())
    {
        _err << "No tasks found.\n";
        return 0;
    }

    if (render(opt).empty())
    {
        _err << "Error: " << _lastError << "\n";
        return 1;
    }
    _out << "Wrote " << _writtenPath << "\n";
    return 0;
}
