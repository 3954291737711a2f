#include "TimelineApp.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

static void print_help(std::ostream& os)
{
    os
        << "trace_timeline (task log to timeline)\n\n"
        << "Usage:\n"
        << "  trace_timeline input.csv [timeline.html]\n"
        << "  trace_timeline input.csv [outdir] --json\n\n"
        << "Input rows: start,end,lane,label[,overhead[,color[,arg...]]]\n"
        << "  (a .json input is read as a previously exported trace.json)\n\n"
        << "Options:\n"
        << "  --json                  Write <outdir>/trace.json (default outdir: static)\n"
        << "  --config FILE           Layout overrides (JSON object)\n"
        << "  --filter PATTERN        Keep tasks whose label contains PATTERN\n"
        << "  --regex                 PATTERN is an ECMAScript regex\n"
        << "  --case                  Case sensitive filter\n"
        << "  --min-dur D             Keep tasks with end - start >= D\n"
        << "  --title TEXT            Document title (default: Timeline)\n"
        << "  --unit TEXT             Time unit shown in labels (default: us)\n"
        << "  -h, --help              Show this help\n";
}

static bool parse_args(int argc, char** argv, TimelineApp::Options& opt, bool& help)
{
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        auto value = [&](const char* name, std::string& out) -> bool
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Missing value for " << name << "\n";
                    return false;
                }
                out = argv[++i];
                return true;
            };

        if (a == "-h" || a == "--help") { help = true; return true; }
        else if (a == "--json") opt.mode = TimelineApp::OutputMode::Json;
        else if (a == "--regex") opt.filterRegex = true;
        else if (a == "--case") opt.filterCaseSensitive = true;
        else if (a == "--config") { if (!value("--config", opt.configPath)) return false; }
        else if (a == "--filter") { if (!value("--filter", opt.filter)) return false; }
        else if (a == "--title") { if (!value("--title", opt.title)) return false; }
        else if (a == "--unit")
        {
            std::string u;
            if (!value("--unit", u)) return false;
            opt.timeUnit = u;
        }
        else if (a == "--min-dur")
        {
            std::string v;
            if (!value("--min-dur", v)) return false;
            char* endp = nullptr;
            opt.minDuration = std::strtod(v.c_str(), &endp);
            if (endp == v.c_str() || *endp != '\0' || opt.minDuration < 0.0)
            {
                std::cerr << "Invalid --min-dur value: " << v << "\n";
                return false;
            }
        }
        else if (a.size() > 1 && a[0] == '-')
        {
            std::cerr << "Unknown option: " << a << "\n";
            return false;
        }
        else positional.push_back(a);
    }

    if (positional.size() > 2)
    {
        std::cerr << "Too many arguments\n";
        return false;
    }
    if (!positional.empty()) opt.inputPath = positional[0];
    if (positional.size() > 1) opt.outputPath = positional[1];
    return true;
}

int main(int argc, char** argv)
{
    TimelineApp::Options opt;
    bool help = false;
    if (!parse_args(argc, argv, opt, help))
    {
        print_help(std::cerr);
        return 1;
    }
    if (help)
    {
        print_help(std::cout);
        return 0;
    }
    if (opt.inputPath.empty())
    {
        print_help(std::cerr);
        return 1;
    }

    TimelineApp app(std::cout, std::cerr);
    return app.run(opt);
}
