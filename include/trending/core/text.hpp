#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trending::core::text {

std::string_view trim(std::string_view Value);
std::string toLower(std::string_view Value);

// Replaces every run of ASCII whitespace with a single space and trims.
std::string collapseWhitespace(std::string_view Value);

// Byte length of the first MaxChars code points of UTF-8 text, or nullopt
// when the text holds MaxChars code points or fewer.
std::optional<std::size_t> utf8PrefixBytes(std::string_view Value,
                                           std::size_t MaxChars);

std::string percentEncodeSegment(std::string_view Segment);

std::string join(const std::vector<std::string> &Parts, std::string_view Sep);

} // namespace trending::core::text
