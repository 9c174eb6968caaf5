#pragma once
#include <string>

namespace sandpool::util {

// Escape a value for use inside single quotes: ' becomes '\''
std::string shell_escape_path(const std::string& value);

// Escape and wrap in single quotes
std::string shell_quote(const std::string& value);

} // namespace sandpool::util
