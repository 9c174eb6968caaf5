#pragma once
#include <string>

namespace sandpool::util {

// Load KEY=VALUE pairs from the first .env found in the working directory,
// its parents, or next to the executable. Existing variables win.
// Only the first call does any work.
void load_dotenv();

// Value of an environment variable, or "" when unset
std::string get_env(const std::string& name);

} // namespace sandpool::util
