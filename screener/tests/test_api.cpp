#include <catch2/catch_test_macros.hpp>
#include "../src/api_server.hpp"
#include "fake_provider.hpp"

TEST_CASE("API handlers", "[api]") {
    auto provider = std::make_shared<FakeProvider>();
    provider->set_series("TCS", linear_closes(100, 1, 60));
    provider->set_series("ITC", linear_closes(400, -1, 60));

    BuilderOptions options;
    options.index_symbol = "";
    UniverseCache cache(60);
    GenerationBuilder builder(Universe({{"TCS", "IT"}, {"ITC", "FMCG"}}), provider,
                              SnapshotBuilder(), options);
    RefreshScheduler scheduler(cache, builder, 3600);

    ApiOptions api_options;
    api_options.data_source = "test feed";
    ApiServer api(api_options, scheduler, cache);

    SECTION("Root") {
        auto r = api.root();
        REQUIRE(r.status == 200);
        REQUIRE(r.body["status"] == "ok");
    }

    SECTION("Empty cache answers 503 and asks for a refresh") {
        auto r = api.stocks();
        REQUIRE(r.status == 503);
        REQUIRE(r.body["fetching"] == true);
        REQUIRE_FALSE(scheduler.request_refresh());

        REQUIRE(api.health().status == 200);
        REQUIRE(api.health().body["status"] == "warming_up");
    }

    SECTION("Empty cache after a failed refresh is unhealthy") {
        provider->fail_unavailable("TCS");
        provider->fail_unavailable("ITC");
        REQUIRE_FALSE(scheduler.run_once());
        auto r = api.health();
        REQUIRE(r.status == 503);
        REQUIRE(r.body["status"] == "unavailable");
    }

    SECTION("Populated cache") {
        REQUIRE(scheduler.run_once());

        auto r = api.stocks();
        REQUIRE(r.status == 200);
        REQUIRE(r.body["stocks"].size() == 2);
        REQUIRE(r.body["dataSource"] == "test feed");
        REQUIRE(r.body["stale"] == false);
        REQUIRE(r.body["nextRefresh"].get<int>() > 0);
        REQUIRE(r.body["nifty"].is_null());

        auto one = api.stock("tcs");
        REQUIRE(one.status == 200);
        REQUIRE(one.body["sym"] == "TCS");

        auto missing = api.stock("ZZZ");
        REQUIRE(missing.status == 404);
        REQUIRE(missing.body.contains("error"));

        auto h = api.health();
        REQUIRE(h.status == 200);
        REQUIRE(h.body["status"] == "healthy");
        REQUIRE(h.body["stocksCached"] == 2);
    }

    SECTION("Failed refresh keeps serving the last generation") {
        REQUIRE(scheduler.run_once());
        provider->fail_unavailable("TCS");
        provider->fail_unavailable("ITC");
        REQUIRE_FALSE(scheduler.run_once());

        REQUIRE(api.stocks().status == 200);
        auto h = api.health();
        REQUIRE(h.status == 200);
        REQUIRE(h.body["status"] == "degraded");
        REQUIRE(h.body["failures"] == 1);
    }
}
