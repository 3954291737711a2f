#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <regex>
#include <algorithm>
#include <vector>

#include "model.hpp"

// ASCII-only lowercasing without locale.
inline char tolower_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
}

// needle must already be lowercase
inline bool contains_icase_ascii(std::string_view haystack, std::string_view loweredNeedle) {
    const auto it = std::search(haystack.begin(), haystack.end(), loweredNeedle.begin(), loweredNeedle.end(),
        [](char h, char n) { return tolower_ascii(h) == n; });
    return it != haystack.end() || loweredNeedle.empty();
}

/// @brief TaskFilter — label pattern (substring or regex) and a minimum duration, applied before layout.
struct TaskFilter {
    enum class Mode { Substring, SubstringCase, Regex };

    std::string pattern;
    Mode mode = Mode::Substring;
    double min_duration = 0.0;

    std::optional<std::regex> rx;   // Mode::Regex
    std::string needle;             // lowered unless SubstringCase

    // False (with outError) when the regex does not compile; the filter then matches everything.
    bool compile(std::string p, bool caseSensitive, bool regexMode, std::string* outError = nullptr) {
        pattern = std::move(p);
        rx.reset();
        needle.clear();
        mode = regexMode ? Mode::Regex : caseSensitive ? Mode::SubstringCase : Mode::Substring;
        if (pattern.empty()) return true;

        switch (mode) {
            case Mode::Regex: {
                auto flags = std::regex::ECMAScript;
                if (!caseSensitive) flags |= std::regex::icase;
                try {
                    rx.emplace(pattern, flags);
                }
                catch (const std::regex_error& e) {
                    if (outError) *outError = "Invalid regex '" + pattern + "': " + e.what();
                    pattern.clear();
                    return false;
                }
                break;
            }
            case Mode::SubstringCase:
                needle = pattern;
                break;
            case Mode::Substring:
                needle.reserve(pattern.size());
                for (char c : pattern) needle += tolower_ascii(c);
                break;
        }
        return true;
    }

    bool active() const { return !pattern.empty() || min_duration > 0.0; }

    bool match(std::string_view label) const {
        if (pattern.empty()) return true;
        switch (mode) {
            case Mode::Regex:         return rx && std::regex_search(label.begin(), label.end(), *rx);
            case Mode::SubstringCase: return label.find(needle) != std::string_view::npos;
            case Mode::Substring:     return contains_icase_ascii(label, needle);
        }
        return true;
    }

    bool pass(const Task& t) const {
        if (min_duration > 0.0 && t.duration() < min_duration) return false;
        return match(t.label);
    }

    // Keeps passing tasks, order preserved. Returns the number removed.
    size_t apply(std::vector<Task>& tasks) const {
        if (!active()) return 0;
        const auto kept = std::stable_partition(tasks.begin(), tasks.end(), [this](const Task& t) { return pass(t); });
        const size_t removed = size_t(tasks.end() - kept);
        tasks.erase(kept, tasks.end());
        return removed;
    }
};
