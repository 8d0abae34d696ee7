#pragma once

#include <string>
#include <vector>
#include <chrono>

namespace util {
    std::string to_iso8601(std::chrono::system_clock::time_point tp);
    std::vector<std::string> split(const std::string& str, char delim);
    int random_jitter(int min_ms, int max_ms);
    double round2(double value);

    // Next weekly (Thursday) expiry after today, formatted "DD Mon 'YY".
    std::string next_weekly_expiry(std::chrono::system_clock::time_point now);
}
