#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <cmath>
#include <ctime>

namespace util {

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        tokens.push_back(token);
    }
    return tokens;
}

int random_jitter(int min_ms, int max_ms) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(min_ms, max_ms);
    return dis(gen);
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string next_weekly_expiry(std::chrono::system_clock::time_point now) {
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);

    // tm_wday: Sunday = 0, Thursday = 4
    int days = (4 - tm_utc.tm_wday + 7) % 7;
    if (days == 0) days = 7;

    auto expiry = std::chrono::system_clock::to_time_t(now + std::chrono::hours(24 * days));
    std::tm tm_exp{};
    gmtime_r(&expiry, &tm_exp);
    std::ostringstream ss;
    ss << std::put_time(&tm_exp, "%d %b '%y");
    return ss.str();
}

} // namespace util
