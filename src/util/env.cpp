#include "util/env.hpp"
#include <spdlog/spdlog.h>

#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sandpool::util {

namespace {

std::string trim(const std::string& s, const char* chars = " \t\r\n") {
    size_t start = s.find_first_not_of(chars);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(chars);
    return s.substr(start, end - start + 1);
}

std::vector<fs::path> dotenv_search_paths() {
    std::vector<fs::path> paths;
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / ".env");
        paths.push_back(cwd.parent_path() / ".env");
        paths.push_back(cwd.parent_path().parent_path() / ".env");
    }

    // Also check relative to executable
    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = fs::path(exe_path).parent_path();
        paths.push_back(exe_dir / ".env");
        paths.push_back(exe_dir.parent_path() / ".env");
    }
    return paths;
}

void load_file(const fs::path& env_path) {
    std::ifstream file(env_path);
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos), " \t");
        if (key.rfind("export ", 0) == 0) {
            key = trim(key.substr(7), " \t");
        }
        std::string value = trim(line.substr(eq_pos + 1));

        if (value.size() >= 2) {
            if ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
        }

        if (!key.empty() && !value.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }
}

} // namespace

void load_dotenv() {
    static std::once_flag once;
    std::call_once(once, [] {
        for (const auto& env_path : dotenv_search_paths()) {
            std::error_code ec;
            if (fs::is_regular_file(env_path, ec)) {
                load_file(env_path);
                spdlog::debug("Loaded environment from {}", env_path.string());
                break;
            }
        }
    });
}

std::string get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace sandpool::util
