#pragma once

#include <charconv>
#include <cmath>
#include <string>
#include <string_view>

// Shortest decimal form that reads back to the same double ("12.5", "1e-07").
inline std::string fmtNumber(double v)
{
    // safe entry
    if (!std::isfinite(v)) return "0";
    if (v == 0.0) v = 0.0; // drop the sign of -0

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    if (res.ec != std::errc()) return "0";
    return std::string(buf, res.ptr);
}

// Coordinates are written with 2 decimals max, trailing zeros dropped.
inline std::string fmtPx(double v)
{
    if (!std::isfinite(v)) return "0";
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed, 2);
    if (res.ec != std::errc()) return "0";
    std::string s(buf, res.ptr);
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

inline std::string_view trim(std::string_view s)
{
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Text and attribute safe (both quote kinds).
inline std::string escapeXml(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

// First maxChars code points of an UTF-8 string.
inline std::string truncateUtf8(std::string_view s, size_t maxChars)
{
    size_t count = 0;
    size_t i = 0;
    while (i < s.size())
    {
        if (count == maxChars) break;
        const unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        if (i + len > s.size()) len = s.size() - i;
        i += len;
        ++count;
    }
    return std::string(s.substr(0, i));
}
