#include "util/shell.hpp"

namespace sandpool::util {

std::string shell_escape_path(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    return out;
}

std::string shell_quote(const std::string& value) {
    return "'" + shell_escape_path(value) + "'";
}

} // namespace sandpool::util
