#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../../include/listing_ranker/quality/DataQualityAssessor.h"
#include <algorithm>
#include <memory>

using namespace listing_ranker;
using namespace listing_ranker::quality;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

class AssessorFixture {
public:
    std::shared_ptr<const config::ScoringConfig> config =
        std::make_shared<const config::ScoringConfig>(config::ScoringConfig::createDefault());
    DataQualityAssessor assessor{config};

    models::CandidateAttributes parse(const nlohmann::json& json) const {
        return models::CandidateAttributes::fromJson(json, config->poiCatalog);
    }

    models::CandidateAttributes mixedCandidate() const {
        return parse({
            {"id", "Q-1"},
            {"bts_station", 400},
            {"school", 99999},
            {"park", nullptr},
            {"market", 95000},
            {"hospital", "n/a"},
            {"cafe", -3},
            {"asset_type_id", 3},
            {"asset_details_selling_price", 4500000},
            {"latitude", 13.75},
            {"longitude", 100.5}
        });
    }
};

TEST_CASE_METHOD(AssessorFixture, "Value classification", "[quality]") {
    auto attrs = mixedCandidate();

    SECTION("Three-valued state") {
        REQUIRE(assessor.classify(attrs, "bts_station") == DataState::Verified);
        REQUIRE(assessor.classify(attrs, "school") == DataState::Missing);
        REQUIRE(assessor.classify(attrs, "park") == DataState::Missing);
        REQUIRE(assessor.classify(attrs, "market") == DataState::Missing);
        REQUIRE(assessor.classify(attrs, "supermarket") == DataState::Missing);
        REQUIRE(assessor.classify(attrs, "hospital") == DataState::Unusable);
        REQUIRE(assessor.classify(attrs, "cafe") == DataState::Unusable);
    }

    SECTION("State names") {
        REQUIRE(dataStateToString(assessor.classify(attrs, "bts_station")) == "verified");
        REQUIRE(dataStateToString(assessor.classify(attrs, "school")) == "missing");
        REQUIRE(dataStateToString(assessor.classify(attrs, "hospital")) == "unusable");
    }

    SECTION("Verified distance never returns a sentinel") {
        REQUIRE(assessor.verifiedDistance(attrs, "bts_station") == 400.0);
        REQUIRE_FALSE(assessor.verifiedDistance(attrs, "school").has_value());
        REQUIRE_FALSE(assessor.verifiedDistance(attrs, "market").has_value());
        REQUIRE_FALSE(assessor.verifiedDistance(attrs, "hospital").has_value());
        REQUIRE_FALSE(assessor.verifiedDistance(attrs, "cafe").has_value());
    }

    SECTION("Zero is a real distance") {
        auto onSite = parse({{"park", 0}});
        REQUIRE(assessor.verifiedDistance(onSite, "park") == 0.0);
    }

    SECTION("Just below the near-sentinel threshold is verified") {
        auto far = parse({{"park", 89999.0}});
        REQUIRE(assessor.classify(far, "park") == DataState::Verified);
    }

    SECTION("Raw missing-value test") {
        models::RawValue sentinel = models::RawValue::fromNumber(99999.0);
        models::RawValue text = models::RawValue::fromText("none");
        models::RawValue null = models::RawValue::null();
        REQUIRE(assessor.isMissingValue(nullptr));
        REQUIRE(assessor.isMissingValue(&null));
        REQUIRE(assessor.isMissingValue(&sentinel));
        REQUIRE_FALSE(assessor.isMissingValue(&text));
    }
}

TEST_CASE_METHOD(AssessorFixture, "Quality report", "[quality]") {
    auto attrs = mixedCandidate();
    auto report = assessor.assess(attrs,
                                  {"bts_station", "school", "hospital"},
                                  {"park", "market", "cafe", "supermarket", "unknown_key"});

    SECTION("Available and missing keys partition the checked keys") {
        REQUIRE(report.availablePoiKeys == std::set<std::string>{"bts_station"});
        REQUIRE(report.missingPoiKeys ==
                std::set<std::string>{"school", "hospital", "park", "market", "cafe", "supermarket"});
        for (const auto& key : report.availablePoiKeys) {
            REQUIRE_FALSE(report.isPoiMissing(key));
        }
    }

    SECTION("Keys outside the catalog are not checked") {
        REQUIRE_FALSE(report.isPoiMissing("unknown_key"));
        REQUIRE_FALSE(report.isPoiAvailable("unknown_key"));
    }

    SECTION("Warnings only for required keys, in order") {
        REQUIRE(report.warnings.size() == 2);
        REQUIRE_THAT(report.warnings[0], ContainsSubstring("School"));
        REQUIRE_THAT(report.warnings[1], ContainsSubstring("Hospital"));
        REQUIRE_THAT(report.warnings[1], ContainsSubstring("Unusable"));
    }

    SECTION("Core validity and score") {
        REQUIRE(report.assetId == "Q-1");
        REQUIRE(report.hasValidPrice);
        REQUIRE(report.hasValidAssetType);
        REQUIRE(report.hasValidLocation);
        REQUIRE_THAT(report.qualityScore, WithinAbs(0.4 * (1.0 / 7.0) + 0.6, 1e-12));
    }

    SECTION("Missing must-haves") {
        REQUIRE(report.missingMustHaves({"bts_station", "school", "hospital"}) ==
                std::vector<std::string>{"school", "hospital"});
    }
}

TEST_CASE_METHOD(AssessorFixture, "Quality score edge cases", "[quality]") {
    SECTION("No checked keys counts POI completeness as full") {
        auto report = assessor.assess(parse(nlohmann::json::object()), {}, {});
        REQUIRE(report.assetId == "unknown");
        REQUIRE_THAT(report.qualityScore, WithinAbs(0.4, 1e-12));
        REQUIRE(report.availablePoiKeys.empty());
        REQUIRE(report.missingPoiKeys.empty());
    }

    SECTION("Everything verified") {
        auto report = assessor.assess(parse({
            {"school", 500}, {"asset_type_id", 4}, {"asset_details_selling_price", 2500000},
            {"location_road_th", "Rama 9"}
        }), {"school"}, {});
        REQUIRE_THAT(report.qualityScore, WithinAbs(1.0, 1e-12));
    }

    SECTION("Locality alone is a valid location") {
        auto report = assessor.assess(parse({{"location_village_th", "Ban Mai"}}), {}, {});
        REQUIRE(report.hasValidLocation);
    }

    SECTION("A single coordinate is not a valid location") {
        auto report = assessor.assess(parse({{"latitude", 13.75}}), {}, {});
        REQUIRE_FALSE(report.hasValidLocation);
    }

    SECTION("Sentinel prices are invalid but large prices are not") {
        REQUIRE_FALSE(assessor.hasValidPrice(parse({{"asset_details_selling_price", 99999}})));
        REQUIRE(assessor.hasValidPrice(parse({{"asset_details_selling_price", 95000}})));
        REQUIRE_FALSE(assessor.hasValidPrice(parse({{"asset_details_selling_price", 0}})));
    }

    SECTION("Duplicate keys are checked once") {
        auto report = assessor.assess(parse({{"school", 500}}), {"school", "school"}, {"school"});
        REQUIRE_THAT(report.qualityScore, WithinAbs(0.4, 1e-12));
        REQUIRE(report.availablePoiKeys.size() == 1);
    }

    SECTION("Deterministic") {
        auto attrs = mixedCandidate();
        auto first = assessor.assess(attrs, {"school"}, {"park"});
        auto second = assessor.assess(attrs, {"school"}, {"park"});
        REQUIRE(first.toJson() == second.toJson());
    }
}

TEST_CASE("Configured sentinels", "[quality]") {
    auto custom = config::ScoringConfig::createDefault();
    custom.dataQuality.missingDataSentinels = {-1.0};
    auto shared = std::make_shared<const config::ScoringConfig>(custom);
    DataQualityAssessor assessor(shared);

    auto attrs = models::CandidateAttributes::fromJson({{"school", -1}, {"park", 99999}, {"cafe", -2}},
                                                       shared->poiCatalog);
    REQUIRE(assessor.classify(attrs, "school") == DataState::Missing);
    // Still caught by the near-sentinel threshold
    REQUIRE(assessor.classify(attrs, "park") == DataState::Missing);
    REQUIRE(assessor.classify(attrs, "cafe") == DataState::Unusable);
}

TEST_CASE_METHOD(AssessorFixture, "Batch assessment", "[quality]") {
    std::vector<models::CandidateAttributes> candidates = {
        parse({{"id", "B-1"}, {"school", 300}}),
        parse({{"id", "B-2"}})
    };
    auto reports = assessor.batchAssess(candidates, {"school"});

    REQUIRE(reports.size() == 2);
    REQUIRE(reports.at("B-1").isPoiAvailable("school"));
    REQUIRE(reports.at("B-2").isPoiMissing("school"));
    REQUIRE(reports.at("B-2").warnings.size() == 1);
}
