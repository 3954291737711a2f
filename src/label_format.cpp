#include "label_format.hpp"
#include "utils.hpp"
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <optional>

namespace
{
    /// @brief Placeholder — one parsed %-conversion.
    struct Placeholder
    {
        std::string flags;
        std::string width;
        std::string precision;  // with the leading '.'
        char conv = 0;
        size_t length = 0;      // chars consumed in the template, '%' included
    };

    // wider fields (or precisions) are not expanded, the placeholder is kept as text
    constexpr size_t kMaxFieldWidth = 4096;

    bool isFlag(char c) { return c == '-' || c == '+' || c == ' ' || c == '#' || c == '0'; }
    bool isDigit(char c) { return c >= '0' && c <= '9'; }
    bool isLengthMod(char c) { return c == 'h' || c == 'l' || c == 'L' || c == 'q' || c == 'j' || c == 'z' || c == 't'; }

    bool fieldFits(std::string_view digits)
    {
        size_t v = 0;
        for (char d : digits)
        {
            v = v * 10 + size_t(d - '0');
            if (v > kMaxFieldWidth) return false;
        }
        return true;
    }

    // tmpl[0] == '%'
    std::optional<Placeholder> parsePlaceholder(std::string_view tmpl)
    {
        Placeholder p;
        size_t i = 1;
        while (i < tmpl.size() && isFlag(tmpl[i])) p.flags += tmpl[i++];
        while (i < tmpl.size() && isDigit(tmpl[i])) p.width += tmpl[i++];
        if (i < tmpl.size() && tmpl[i] == '.')
        {
            p.precision += tmpl[i++];
            while (i < tmpl.size() && isDigit(tmpl[i])) p.precision += tmpl[i++];
        }
        while (i < tmpl.size() && isLengthMod(tmpl[i])) ++i;
        if (i >= tmpl.size()) return std::nullopt;
        if (!fieldFits(p.width) || !fieldFits(std::string_view(p.precision).substr(p.precision.empty() ? 0 : 1)))
            return std::nullopt;

        const char c = tmpl[i];
        switch (c)
        {
            case 'd': case 'i': case 'u': case 'x': case 'X': case 'o':
            case 'f': case 'F': case 'e': case 'E': case 'g': case 'G':
            case 's': case 'c':
                p.conv = c;
                p.length = i + 1;
                return p;
            default:
                return std::nullopt;
        }
    }

    std::optional<long long> toInteger(std::string_view s)
    {
        s = trim(s);
        if (!s.empty() && s.front() == '+') s.remove_prefix(1);
        long long v = 0;
        auto res = std::from_chars(s.data(), s.data() + s.size(), v);
        if (res.ec == std::errc() && res.ptr == s.data() + s.size() && !s.empty())
            return v;
        return std::nullopt;
    }

    std::optional<double> toDouble(std::string_view s)
    {
        s = trim(s);
        if (!s.empty() && s.front() == '+') s.remove_prefix(1);
        double v = 0;
        auto res = std::from_chars(s.data(), s.data() + s.size(), v);
        if (res.ec == std::errc() && res.ptr == s.data() + s.size() && !s.empty())
            return v;
        return std::nullopt;
    }

    // nullopt when snprintf fails (EOVERFLOW and the like)
    template <class T>
    std::optional<std::string> sprintfOne(const std::string& fmt, T value)
    {
        char buf[128];
        int n = std::snprintf(buf, sizeof(buf), fmt.c_str(), value);
        if (n < 0) return std::nullopt;
        if (size_t(n) < sizeof(buf)) return std::string(buf, size_t(n));
        std::string big(size_t(n) + 1, '\0');
        if (std::snprintf(big.data(), big.size(), fmt.c_str(), value) < 0) return std::nullopt;
        big.resize(size_t(n));
        return big;
    }

    // integer text, or a finite double truncated toward zero when it fits in long long
    std::optional<long long> toIntegerLossy(const std::string& arg)
    {
        if (const std::optional<long long> v = toInteger(arg)) return v;
        const std::optional<double> d = toDouble(arg);
        // [-2^63, 2^63), both bounds exact in double
        constexpr double lo = double(std::numeric_limits<long long>::min());
        if (!d || !std::isfinite(*d) || *d < lo || *d >= -lo) return std::nullopt;
        return static_cast<long long>(*d);
    }

    std::optional<std::string> render(const Placeholder& p, const std::string& arg)
    {
        const std::string head = "%" + p.flags + p.width + p.precision;

        switch (p.conv)
        {
            case 'd': case 'i':
            {
                const std::optional<long long> v = toIntegerLossy(arg);
                if (!v) return arg;
                return sprintfOne(head + "lld", *v);
            }
            case 'u': case 'x': case 'X': case 'o':
            {
                const std::optional<long long> v = toIntegerLossy(arg);
                if (!v) return arg;
                return sprintfOne(head + "ll" + p.conv, static_cast<unsigned long long>(*v));
            }
            case 'f': case 'F': case 'e': case 'E': case 'g': case 'G':
            {
                const std::optional<double> d = toDouble(arg);
                if (!d) return arg;
                return sprintfOne(head + p.conv, *d);
            }
            case 'c':
            {
                if (arg.empty()) return arg;
                // single character only, anything longer goes through as text
                if (arg.size() == 1) return sprintfOne(head + "c", int(static_cast<unsigned char>(arg[0])));
                return arg;
            }
            default:
                return sprintfOne(head + "s", arg.c_str());
        }
    }

    std::string unquote(std::string_view s)
    {
        s = trim(s);
        if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
            s = s.substr(1, s.size() - 2);
        return std::string(s);
    }
}

std::string format_label(std::string_view tmpl, const std::vector<std::string>& args)
{
    std::string out;
    out.reserve(tmpl.size() + 16);
    size_t nextArg = 0;

    size_t i = 0;
    while (i < tmpl.size())
    {
        const char c = tmpl[i];
        if (c != '%')
        {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 < tmpl.size() && tmpl[i + 1] == '%')
        {
            out += '%';
            i += 2;
            continue;
        }

        const std::optional<Placeholder> p = parsePlaceholder(tmpl.substr(i));
        if (!p || nextArg >= args.size())
        {
            // unmatched: keep the '%' and move on, the rest is copied verbatim
            out += c;
            ++i;
            continue;
        }
        const std::optional<std::string> text = render(*p, args[nextArg++]);
        // formatting failed: placeholder kept verbatim, its argument consumed
        out += text ? *text : std::string(tmpl.substr(i, p->length));
        i += p->length;
    }
    return out;
}

std::vector<std::string> split_label_args(const std::vector<std::string>& columns)
{
    std::vector<std::string> out;
    if (columns.size() == 1)
    {
        const std::string_view one = trim(columns.front());
        if (one.size() >= 2 && one.front() == '[' && one.back() == ']')
        {
            const std::string_view inner = trim(one.substr(1, one.size() - 2));
            if (inner.empty()) return out;
            size_t pos = 0;
            while (true)
            {
                const size_t comma = inner.find(',', pos);
                const std::string_view item = inner.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
                out.push_back(unquote(item));
                if (comma == std::string_view::npos) break;
                pos = comma + 1;
            }
            return out;
        }
    }
    out.reserve(columns.size());
    for (const auto& col : columns) out.push_back(std::string(trim(col)));
    return out;
}
