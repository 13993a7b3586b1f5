// lineset/cpp/common/text_common.h
#pragma once
#include <string>
#include <string_view>
#include <vector>

// UTF-8 aware. Trims Unicode White_Space (ASCII space/\t/\n/\v/\f/\r,
// U+0085, NBSP, U+1680, U+2000..U+200A, U+2028/2029, U+202F, U+205F, U+3000).
std::string_view trim_view(std::string_view s);
std::string trim_copy(std::string_view s);

// UTF-8 decode -> simple lowercase mapping -> re-encode.
// Covers ASCII, Latin-1, Latin Extended-A / Additional, Greek, Cyrillic
// (incl. Kazakh), Armenian, fullwidth Latin. Invalid bytes are copied through.
std::string to_lower_copy(std::string_view s);

// trim + lower. Empty result => the entry is blank.
std::string normalize_entry(std::string_view s);

// Replaces every "\r\n" with "\n", then splits on '\n'.
// A trailing '\n' yields a final empty line, same as an empty input yields one.
std::vector<std::string> split_lines(std::string_view content);

std::string join_lines(const std::vector<std::string>& lines);
