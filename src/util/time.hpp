#pragma once
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace sandpool::util {

// Milliseconds since the Unix epoch
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// n lowercase hex characters
inline std::string random_hex(size_t n) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char digits[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        out += digits[dist(rng)];
    }
    return out;
}

} // namespace sandpool::util
