#pragma once
#include <string>
#include <string_view>
#include <vector>

// printf-style substitution of args into a label template.
// - %[flags][width][.prec](d|i|u|x|X|o|f|F|e|E|g|G|s|c) take the next argument
// - numeric conversions coerce the argument; when it is not a number the
//   argument text is inserted as-is
// - "%%" -> "%"
// - no argument left, unknown conversion, or width/precision above 4096:
//   placeholder kept verbatim
// - extra arguments are ignored
std::string format_label(std::string_view tmpl, const std::vector<std::string>& args);

// Auxiliary columns -> argument list. A single bracketed column "[a, b]" is
// split on commas (items trimmed, surrounding quotes removed); any other
// column is one argument.
std::vector<std::string> split_label_args(const std::vector<std::string>& columns);
