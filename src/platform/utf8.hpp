#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace kestrel::utf8
{

inline constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Decode UTF-8 into code points. Malformed sequences yield U+FFFD and
// decoding resumes at the next byte.
std::vector<char32_t> decode(std::string_view text);

// Append the UTF-8 encoding of `cp` to `out`. Invalid code points are
// encoded as U+FFFD.
void append(std::string& out, char32_t cp);

}   // namespace kestrel::utf8
