#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../../include/listing_ranker/config/PoiCatalog.h"
#include <stdexcept>

using namespace listing_ranker::config;
using Catch::Matchers::WithinAbs;

TEST_CASE("Default POI catalog", "[config][catalog]") {
    auto catalog = PoiCatalog::createDefault();

    SECTION("Size and lookup") {
        REQUIRE(catalog.size() == 26);
        REQUIRE(catalog.contains("school"));
        REQUIRE_FALSE(catalog.contains("spaceport"));
        REQUIRE(catalog.find("spaceport") == nullptr);
    }

    SECTION("Transit entries") {
        const auto* bts = catalog.find("bts_station");
        REQUIRE(bts != nullptr);
        REQUIRE(bts->radius == 3000.0);
        REQUIRE(bts->curve == CurveType::EXPONENTIAL);
        REQUIRE(bts->isRapidTransit);

        REQUIRE(catalog.isRapidTransit("mrt"));
        REQUIRE_FALSE(catalog.isRapidTransit("train_station"));
        REQUIRE_FALSE(catalog.isRapidTransit("unknown_key"));

        auto rapid = catalog.rapidTransitKeys();
        REQUIRE(rapid == std::vector<std::string>{"bts_station", "mrt"});
    }

    SECTION("Avoid-relevant radius") {
        REQUIRE(catalog.find("market")->radius == 1500.0);
        REQUIRE(catalog.find("market")->curve == CurveType::LINEAR);
    }

    SECTION("Display names fall back to the key") {
        REQUIRE(catalog.displayName("veterinary") == "Veterinary clinic");
        REQUIRE(catalog.displayName("unknown_key") == "unknown_key");
    }
}

TEST_CASE("Curve names", "[config][catalog]") {
    REQUIRE(parseCurveType("linear") == CurveType::LINEAR);
    REQUIRE(parseCurveType("Exponential") == CurveType::EXPONENTIAL);
    REQUIRE_FALSE(parseCurveType("quadratic").has_value());
    REQUIRE(curveTypeToString(CurveType::EXPONENTIAL) == "exponential");
}

TEST_CASE("POI catalog overrides", "[config][catalog]") {
    auto base = PoiCatalog::createDefault();

    SECTION("Fields merge onto existing entries") {
        auto catalog = base.withOverrides({{"school", {{"radius", 1500}}}});
        const auto* school = catalog.find("school");
        REQUIRE(school->radius == 1500.0);
        REQUIRE(school->displayName == "School");
        REQUIRE(school->curve == CurveType::LINEAR);
        // The base catalog is untouched
        REQUIRE(base.find("school")->radius == 3000.0);
    }

    SECTION("New entries are appended") {
        auto catalog = base.withOverrides({
            {"airport_link", {{"radius", 2500}, {"curve", "exponential"},
                              {"display_name", "Airport Rail Link"}, {"poi_type", "rapid_transit"}}}
        });
        REQUIRE(catalog.size() == 27);
        REQUIRE(catalog.isRapidTransit("airport_link"));
        REQUIRE_THAT(catalog.find("airport_link")->radius, WithinAbs(2500.0, 1e-9));
        REQUIRE(catalog.rapidTransitKeys().size() == 3);
    }

    SECTION("Invalid values throw") {
        REQUIRE_THROWS_AS(base.withOverrides({{"school", {{"radius", 0}}}}), std::runtime_error);
        REQUIRE_THROWS_AS(base.withOverrides({{"school", {{"radius", -10}}}}), std::runtime_error);
        REQUIRE_THROWS_AS(base.withOverrides({{"school", {{"weight", -1}}}}), std::runtime_error);
        REQUIRE_THROWS_AS(base.withOverrides({{"school", {{"curve", "cubic"}}}}), std::runtime_error);
        REQUIRE_THROWS_AS(base.withOverrides({{"school", 42}}), std::runtime_error);
        REQUIRE_THROWS_AS(base.withOverrides(nlohmann::json::array()), std::runtime_error);
    }

    SECTION("Serializes every entry") {
        auto json = base.toJson();
        REQUIRE(json.size() == 26);
        REQUIRE(json["mrt"]["is_rapid_transit"] == true);
        REQUIRE(json["market"]["curve"] == "linear");
    }
}
