#pragma once

#include <string>
#include <string_view>

namespace famgraph::util {

std::string Trim(std::string_view text);

std::string ToLower(std::string_view text);

// Trimmed, lower-cased, inner whitespace runs collapsed to one space.
std::string NormalizeName(std::string_view text);

// Case-insensitive substring test.
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

} // namespace famgraph::util
