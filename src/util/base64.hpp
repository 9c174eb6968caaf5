#pragma once
#include <optional>
#include <string>

namespace sandpool::util {

// Standard alphabet with '=' padding, no line breaks
std::string base64_encode(const std::string& data);

// Strict decode. Surrounding whitespace is ignored; any other character
// outside the alphabet, or bad padding, yields nullopt.
std::optional<std::string> base64_decode(const std::string& encoded);

} // namespace sandpool::util
