#include "csv_provider.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>

CsvDirectoryProvider::CsvDirectoryProvider(const std::string& directory)
    : directory_(directory) {}

int64_t CsvDirectoryProvider::parse_date(const std::string& date) {
    std::tm tm{};
    if (sscanf(date.c_str(), "%d-%d-%d", &tm.tm_year, &tm.tm_mon, &tm.tm_mday) != 3) {
        throw std::invalid_argument("bad date '" + date + "'");
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return static_cast<int64_t>(timegm(&tm));
}

PriceSeries CsvDirectoryProvider::fetch_daily(const std::string& symbol, int days) {
    std::filesystem::path path = std::filesystem::path(directory_) / (symbol + ".csv");

    if (!std::filesystem::exists(path)) {
        throw ProviderFatal(symbol + ": no data file " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ProviderUnavailable(symbol + ": cannot open " + path.string());
    }

    PriceSeries series;
    series.symbol = symbol;

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.empty() || line == "\r") continue;

        auto fields = util::split(line, ',');
        if (line_no == 1 && !fields.empty() && fields[0] == "Date") continue;

        if (fields.size() < 5) {
            throw ProviderUnavailable(symbol + ": line " + std::to_string(line_no) +
                                      " has " + std::to_string(fields.size()) + " fields");
        }

        try {
            series.append(parse_date(fields[0]),
                          std::stod(fields[1]),
                          std::stod(fields[2]),
                          std::stod(fields[3]),
                          std::stod(fields[4]));
        } catch (const std::exception& e) {
            throw ProviderUnavailable(symbol + ": line " + std::to_string(line_no) +
                                      ": " + e.what());
        }
    }

    if (series.empty()) {
        throw ProviderFatal(symbol + ": " + path.string() + " has no bars");
    }

    if (days > 0) series.keep_last(static_cast<size_t>(days));
    spdlog::debug("{}: loaded {} bars from {}", symbol, series.size(), path.string());
    return series;
}
