#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../../include/listing_ranker/models/ScoringResult.h"
#include "../../include/listing_ranker/models/DataQualityReport.h"

using namespace listing_ranker::models;
using Catch::Matchers::WithinAbs;

TEST_CASE("Scoring result accumulation", "[models][result]") {
    ScoringResult result;

    result.addPositive("asset_type", "Matches requested type (Condominium)", 2.0);
    result.addPositive("nice_to_have:park", "Has Public park", 0.25);
    result.addNegative("price_range", "Price above range", -3.0);
    result.addWarning("must_have:school", "No data for School (cannot verify)");

    SECTION("Score equals the breakdown sum") {
        REQUIRE_THAT(result.score, WithinAbs(-0.75, 1e-12));
        double sum = 0.0;
        for (const auto& [label, contribution] : result.scoreBreakdown) sum += contribution;
        REQUIRE_THAT(sum, WithinAbs(result.score, 1e-12));
    }

    SECTION("Warnings carry no contribution and no breakdown entry") {
        REQUIRE(result.scoreBreakdown.count("must_have:school") == 0);
        REQUIRE(result.negativeSignals.size() == 2);
        REQUIRE(result.negativeSignals.back().kind == SignalKind::WARNING);
        REQUIRE(result.negativeSignals.back().contribution == 0.0);
    }

    SECTION("Signals keep insertion order") {
        REQUIRE(result.positiveSignals.size() == 2);
        REQUIRE(result.positiveSignals[0].label == "asset_type");
        REQUIRE(result.positiveSignals[1].label == "nice_to_have:park");
    }

    SECTION("Repeated labels accumulate") {
        result.addPositive("asset_type", "again", 1.0);
        REQUIRE_THAT(result.scoreBreakdown.at("asset_type"), WithinAbs(3.0, 1e-12));
    }

    SECTION("Disqualification") {
        REQUIRE_FALSE(result.isDisqualified);
        REQUIRE_FALSE(result.disqualificationReason.has_value());

        result.disqualify("Too far");
        REQUIRE(result.isDisqualified);
        REQUIRE(*result.disqualificationReason == "Too far");
        REQUIRE(result.score == 0.0);
        REQUIRE(result.scoreBreakdown.empty());
        // Signals raised before the failing gate are kept
        REQUIRE(result.positiveSignals.size() == 2);
    }
}

TEST_CASE("Signal rendering", "[models][result]") {
    REQUIRE(renderSignal({SignalKind::POSITIVE, "a", "Near BTS", 1.0}) == "[+] Near BTS");
    REQUIRE(renderSignal({SignalKind::NEGATIVE, "b", "Price above range", -3.0}) == "[-] Price above range");
    REQUIRE(renderSignal({SignalKind::WARNING, "c", "No data for School", 0.0}) == "[!] No data for School");
    REQUIRE(signalKindToString(SignalKind::WARNING) == "warning");
}

TEST_CASE("Scoring result serialization", "[models][result]") {
    ScoringResult result;
    result.addPositive("asset_type", "Matches", 2.0);
    DataQualityReport quality;
    quality.assetId = "A-1";
    quality.qualityScore = 0.9;
    result.dataQuality = quality;

    auto json = result.toJson();
    REQUIRE(json["score"] == 2.0);
    REQUIRE(json["is_disqualified"] == false);
    REQUIRE(json["disqualification_reason"].is_null());
    REQUIRE(json["positive_signals"][0]["kind"] == "positive");
    REQUIRE(json["positive_signals"][0]["contribution"] == 2.0);
    REQUIRE(json["score_breakdown"]["asset_type"] == 2.0);
    REQUIRE(json["data_quality"]["asset_id"] == "A-1");

    result.disqualify("Wrong type");
    REQUIRE(result.toJson()["disqualification_reason"] == "Wrong type");
}

TEST_CASE("Data quality report queries", "[models][quality]") {
    DataQualityReport report;
    report.availablePoiKeys = {"bts_station"};
    report.missingPoiKeys = {"school", "park"};

    REQUIRE(report.isPoiAvailable("bts_station"));
    REQUIRE_FALSE(report.isPoiMissing("bts_station"));
    REQUIRE(report.isPoiMissing("school"));
    REQUIRE(report.missingMustHaves({"bts_station", "school", "hospital"}) == std::vector<std::string>{"school"});

    auto json = report.toJson();
    REQUIRE(json["missing_poi_keys"] == nlohmann::json({"park", "school"}));
}
