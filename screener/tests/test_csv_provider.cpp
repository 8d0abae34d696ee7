#include <catch2/catch_test_macros.hpp>
#include "../src/csv_provider.hpp"
#include "../src/errors.hpp"
#include "../src/universe.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

// Scratch directory removed when the test case ends.
struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() /
               ("swingscout_test_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(path / name);
        out << content;
    }
};

} // namespace

TEST_CASE("CSV directory provider", "[csv]") {
    TempDir dir;
    CsvDirectoryProvider provider(dir.path.string());

    SECTION("Reads bars oldest first") {
        dir.write("TCS.csv",
                  "Date,Open,High,Low,Close,Volume\n"
                  "2026-10-12,4100,4150,4090,4140,120000\n"
                  "2026-10-13,4140,4160,4120,4155,98000\n"
                  "2026-10-14,4155,4170,4101.5,4110.25,143000\n");

        auto series = provider.fetch_daily("TCS", 60);
        REQUIRE(series.symbol == "TCS");
        REQUIRE(series.size() == 3);
        REQUIRE(series.closes.back() == 4110.25);
        REQUIRE(series.lows.back() == 4101.5);
        REQUIRE(series.timestamps.front() == CsvDirectoryProvider::parse_date("2026-10-12"));
        REQUIRE(series.timestamps[1] - series.timestamps[0] == 86400);
    }

    SECTION("Keeps only the requested number of bars") {
        dir.write("ITC.csv",
                  "Date,Open,High,Low,Close\n"
                  "2026-10-12,400,410,395,405\n"
                  "2026-10-13,405,412,401,410\n"
                  "2026-10-14,410,415,404,406\n");

        auto series = provider.fetch_daily("ITC", 2);
        REQUIRE(series.size() == 2);
        REQUIRE(series.closes.front() == 410.0);
    }

    SECTION("Missing file is fatal") {
        REQUIRE_THROWS_AS(provider.fetch_daily("NOPE", 60), ProviderFatal);
    }

    SECTION("Header only is fatal") {
        dir.write("EMPTY.csv", "Date,Open,High,Low,Close\n");
        REQUIRE_THROWS_AS(provider.fetch_daily("EMPTY", 60), ProviderFatal);
    }

    SECTION("Malformed rows are transient") {
        dir.write("BAD.csv",
                  "Date,Open,High,Low,Close\n"
                  "2026-10-12,400,410,395\n");
        REQUIRE_THROWS_AS(provider.fetch_daily("BAD", 60), ProviderUnavailable);

        dir.write("NAN.csv",
                  "Date,Open,High,Low,Close\n"
                  "2026-10-12,400,abc,395,405\n");
        REQUIRE_THROWS_AS(provider.fetch_daily("NAN", 60), ProviderUnavailable);
    }

    SECTION("Epoch date parses to zero") {
        REQUIRE(CsvDirectoryProvider::parse_date("1970-01-01") == 0);
        REQUIRE(CsvDirectoryProvider::parse_date("1970-01-02") == 86400);
        REQUIRE_THROWS(CsvDirectoryProvider::parse_date("yesterday"));
    }
}

TEST_CASE("Universe", "[universe]") {
    SECTION("Built-in Nifty 50") {
        auto universe = Universe::nifty50();
        REQUIRE(universe.size() == 50);
        REQUIRE(universe.members().front().symbol == "RELIANCE");
        REQUIRE(universe.sector_of("TCS") == std::optional<std::string>("IT"));
        REQUIRE(universe.sector_of("M&M") == std::optional<std::string>("Auto"));
        REQUIRE_FALSE(universe.sector_of("AAPL").has_value());
    }

    SECTION("Loaded from a file") {
        TempDir dir;
        dir.write("universe.csv",
                  "# watchlist\n"
                  "TCS,IT\n"
                  "\n"
                  "ZOMATO\n"
                  "SBIN, Banking\n");

        auto universe = Universe::load_from_file((dir.path / "universe.csv").string());
        REQUIRE(universe.size() == 3);
        REQUIRE(universe.members()[1].symbol == "ZOMATO");
        REQUIRE(universe.members()[1].sector == "Misc");
        REQUIRE(universe.sector_of("SBIN") == std::optional<std::string>("Banking"));
    }

    SECTION("Unreadable or empty files are rejected") {
        REQUIRE_THROWS_AS(Universe::load_from_file("/nonexistent/universe.csv"), std::runtime_error);

        TempDir dir;
        dir.write("empty.csv", "# nothing here\n");
        REQUIRE_THROWS_AS(Universe::load_from_file((dir.path / "empty.csv").string()),
                          std::runtime_error);
    }
}
