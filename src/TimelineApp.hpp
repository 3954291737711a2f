#pragma once
#include "model.hpp"
#include "config.hpp"
#include "filter.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

/// @brief TimelineApp — one batch run: load, filter, lay out, render, write.
class TimelineApp
{
public:
    enum class OutputMode { Html, Json };

    /// @brief Options — everything the CLI can set.
    struct Options
    {
        std::string inputPath;
        std::string outputPath;         // empty -> default of the mode
        OutputMode  mode = OutputMode::Html;
        std::string configPath;
        std::string filter;
        bool        filterRegex = false;
        bool        filterCaseSensitive = false;
        double      minDuration = 0.0;
        std::string title = "Timeline";
        std::optional<std::string> timeUnit;
    };

    static constexpr const char* kDefaultHtmlOutput = "timeline.html";
    static constexpr const char* kDefaultJsonDir = "static";
    static constexpr const char* kJsonFileName = "trace.json";

    TimelineApp(std::ostream& out, std::ostream& err);

    // Exit code: 0 on success or empty input (no artifact), 1 on error.
    int run(const Options& opt);

    bool loadFile(const std::string& path);
    bool applyOptions(const Options& opt);
    // empty string when nothing was written
    std::string render(const Options& opt);

    const std::vector<Task>& tasks() const { return _tasks; }
    const std::vector<Diagnostic>& diagnostics() const { return _diagnostics; }
    const LayoutConfig& config() const { return _cfg; }
    const std::string& lastError() const { return _lastError; }
    const std::string& writtenPath() const { return _writtenPath; }

private:
    void flushDiagnostics();
    std::string writeHtml(const Options& opt);
    std::string writeJson(const Options& opt);

private:
    std::ostream& _out;
    std::ostream& _err;

    std::vector<Task> _tasks;
    std::vector<Diagnostic> _diagnostics;
    size_t _reported;

    LayoutConfig _cfg;
    TaskFilter _filter;

    std::string _lastError;
    std::string _writtenPath;
};
