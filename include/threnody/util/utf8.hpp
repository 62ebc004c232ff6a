#pragma once

#include <cstddef>
#include <string>

namespace threnody::util {

// True when every byte sequence in data is well-formed UTF-8
bool is_valid_utf8(const std::string& data);

// Number of codepoints; invalid sequences count as one each
size_t codepoint_length(const std::string& data);

// Strip leading and trailing ASCII whitespace
std::string trim(const std::string& data);

} // namespace threnody::util
