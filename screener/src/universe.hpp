#pragma once

#include <string>
#include <vector>
#include <optional>

struct UniverseMember {
    std::string symbol;
    std::string sector;
};

class Universe {
public:
    Universe() = default;
    explicit Universe(std::vector<UniverseMember> members);

    // Nifty 50 constituents with their sectors.
    static Universe nifty50();

    // Lines of "SYMBOL,Sector"; blank lines and '#' comments are skipped.
    static Universe load_from_file(const std::string& path);

    const std::vector<UniverseMember>& members() const { return members_; }
    size_t size() const { return members_.size(); }
    std::optional<std::string> sector_of(const std::string& symbol) const;

private:
    std::vector<UniverseMember> members_;
};
