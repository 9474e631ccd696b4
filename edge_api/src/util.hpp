#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>

namespace util {
    // Millisecond clock; injectable so windows and cooldowns can be tested.
    using ClockFn = std::function<int64_t()>;

    int64_t steady_now_ms();

    std::string trim(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string to_lower(std::string str);
    bool contains_ci(const std::string& haystack, const std::string& needle);

    std::string generate_request_id();
    std::string sha256_hex(const std::string& data);
}
