#include "universe.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

Universe::Universe(std::vector<UniverseMember> members)
    : members_(std::move(members)) {}

Universe Universe::nifty50() {
    return Universe({
        {"RELIANCE", "Energy"},     {"TCS", "IT"},              {"HDFCBANK", "Banking"},
        {"INFY", "IT"},             {"ICICIBANK", "Banking"},   {"HINDUNILVR", "FMCG"},
        {"SBIN", "Banking"},        {"BHARTIARTL", "Telecom"},  {"ITC", "FMCG"},
        {"KOTAKBANK", "Banking"},   {"LT", "Infra"},            {"AXISBANK", "Banking"},
        {"ASIANPAINT", "Paints"},   {"MARUTI", "Auto"},         {"WIPRO", "IT"},
        {"SUNPHARMA", "Pharma"},    {"TITAN", "Consumer"},      {"BAJFINANCE", "NBFC"},
        {"POWERGRID", "Power"},     {"NTPC", "Power"},          {"TATASTEEL", "Metal"},
        {"JSWSTEEL", "Metal"},      {"ADANIPORTS", "Port"},     {"HCLTECH", "IT"},
        {"ULTRACEMCO", "Cement"},   {"NESTLEIND", "FMCG"},      {"TATAMOTORS", "Auto"},
        {"M&M", "Auto"},            {"ONGC", "Energy"},         {"COALINDIA", "Mining"},
        {"BPCL", "Energy"},         {"GRASIM", "Conglomerate"}, {"TECHM", "IT"},
        {"INDUSINDBK", "Banking"},  {"EICHERMOT", "Auto"},      {"DRREDDY", "Pharma"},
        {"CIPLA", "Pharma"},        {"DIVISLAB", "Pharma"},     {"BAJAJFINSV", "NBFC"},
        {"TATACONSUM", "FMCG"},     {"APOLLOHOSP", "Healthcare"}, {"BRITANNIA", "FMCG"},
        {"HEROMOTOCO", "Auto"},     {"HINDALCO", "Metal"},      {"SBILIFE", "Insurance"},
        {"HDFCLIFE", "Insurance"},  {"UPL", "Agro"},            {"SHRIRAMFIN", "NBFC"},
        {"BEL", "Defence"},         {"TRENT", "Retail"},
    });
}

Universe Universe::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open universe file: " + path);
    }

    std::vector<UniverseMember> members;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        auto fields = util::split(line, ',');
        if (fields.empty() || fields[0].empty() || fields[0][0] == '#') continue;

        UniverseMember m;
        m.symbol = fields[0];
        m.sector = fields.size() > 1 && !fields[1].empty() ? fields[1] : "Misc";
        members.push_back(m);
    }

    if (members.empty()) {
        throw std::runtime_error("Universe file has no symbols: " + path);
    }

    spdlog::info("Loaded {} symbols from {} ({} lines)", members.size(), path, line_no);
    return Universe(std::move(members));
}

std::optional<std::string> Universe::sector_of(const std::string& symbol) const {
    for (const auto& m : members_) {
        if (m.symbol == symbol) return m.sector;
    }
    return std::nullopt;
}
