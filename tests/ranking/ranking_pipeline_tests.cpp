#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../../include/listing_ranker/ranking/RankingPipeline.h"
#include <fstream>
#include <memory>
#include <string>

using namespace listing_ranker;
using namespace listing_ranker::ranking;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

namespace {

std::shared_ptr<const config::ScoringConfig> makeConfig(void (*tweak)(config::ScoringConfig&) = nullptr) {
    auto settings = config::ScoringConfig::createDefault();
    if (tweak) {
        tweak(settings);
    }
    return std::make_shared<const config::ScoringConfig>(std::move(settings));
}

std::vector<RankingCandidate> parsePool(const nlohmann::json& pool) {
    return RankingPipeline::parseCandidates(pool, config::ScoringConfig::createDefault().poiCatalog);
}

models::Intent condoNearBts() {
    return models::Intent::fromJson({
        {"asset_types", nlohmann::json::array({"condo"})},
        {"must_have", nlohmann::json::array({"bts_station"})}
    });
}

nlohmann::json wrapped(const std::string& id, double semantic, const nlohmann::json& metadata) {
    return {{"id", id}, {"semantic_score", semantic}, {"metadata", metadata}};
}

} // namespace

TEST_CASE("Parsing retrieved candidates", "[ranking]") {
    const auto catalog = config::ScoringConfig::createDefault().poiCatalog;

    SECTION("Retrieval wrapper") {
        auto candidate = RankingPipeline::parseCandidate(
            wrapped("w-1", 1.4, {{"asset_type_id", 3}, {"bts_station", 300}}), catalog);
        REQUIRE(candidate.has_value());
        REQUIRE(candidate->attributes.id == "w-1");
        REQUIRE(candidate->attributes.assetTypeId == 3);
        REQUIRE(candidate->semanticScore == 1.0);
        REQUIRE(candidate->attributes.poiValue("bts_station") != nullptr);
    }

    SECTION("Metadata id wins over the wrapper id") {
        auto candidate = RankingPipeline::parseCandidate(wrapped("outer", 0.5, {{"id", "inner"}}), catalog);
        REQUIRE(candidate->attributes.id == "inner");
    }

    SECTION("Flat record") {
        auto candidate = RankingPipeline::parseCandidate(
            {{"id", "f-1"}, {"semantic_score", 0.4}, {"school", 800}}, catalog);
        REQUIRE(candidate.has_value());
        REQUIRE(candidate->attributes.id == "f-1");
        REQUIRE_THAT(candidate->semanticScore, WithinAbs(0.4, 1e-12));
        REQUIRE(candidate->attributes.poiValue("school") != nullptr);
    }

    SECTION("Negative or missing semantic score") {
        REQUIRE(RankingPipeline::parseCandidate({{"semantic_score", -0.2}}, catalog)->semanticScore == 0.0);
        REQUIRE(RankingPipeline::parseCandidate({{"id", "x"}}, catalog)->semanticScore == 0.0);
    }

    SECTION("Non-objects") {
        REQUIRE_FALSE(RankingPipeline::parseCandidate(nlohmann::json(42), catalog).has_value());
        auto list = RankingPipeline::parseCandidates(
            nlohmann::json::array({{{"id", "a"}}, 5, "text", {{"id", "b"}}}), catalog);
        REQUIRE(list.size() == 2);
        REQUIRE(list[1].attributes.id == "b");
        REQUIRE(RankingPipeline::parseCandidates(nlohmann::json::object(), catalog).empty());
    }
}

TEST_CASE("Score blending", "[ranking]") {
    RankingPipeline pipeline(makeConfig());
    REQUIRE_THAT(pipeline.combineScores(2.0, 0.5, 0.3), WithinAbs(0.7 * 2.0 + 0.2 * 0.5 + 0.1 * 0.3, 1e-12));
    REQUIRE_THAT(pipeline.combineScores(0.0, 0.0, 0.0), WithinAbs(0.0, 1e-12));
}

TEST_CASE("Ranking a pool", "[ranking]") {
    auto pool = parsePool(nlohmann::json::array({
        wrapped("a", 0.9, {{"asset_type_id", 3}, {"bts_station", 300}}),
        wrapped("b", 0.95, {{"asset_type_id", 4}, {"bts_station", 100}}),
        wrapped("c", 0.5, {{"asset_type_id", 12}, {"bts_station", 2500}}),
        wrapped("d", 0.9, {{"asset_type_id", 3}, {"bts_station", 300}})
    }));
    REQUIRE(pool.size() == 4);

    SECTION("Disqualified candidates are dropped and the rest sorted") {
        RankingPipeline pipeline(makeConfig());
        auto outcome = pipeline.rank(pool, condoNearBts());

        REQUIRE(outcome.poolSize == 4);
        REQUIRE(outcome.disqualified == 1);
        REQUIRE(outcome.filteredByQuality == 0);
        REQUIRE(outcome.message.empty());
        REQUIRE(outcome.hasResults());
        REQUIRE(outcome.results.size() == 3);

        // Ties keep retrieval order
        REQUIRE(outcome.results[0].attributes.id == "a");
        REQUIRE(outcome.results[1].attributes.id == "d");
        REQUIRE(outcome.results[2].attributes.id == "c");
        REQUIRE(outcome.results[0].inputIndex == 0);
        REQUIRE(outcome.results[1].inputIndex == 3);

        double structured = 2.0 + 1.5 * 0.9 * 0.9;
        REQUIRE_THAT(outcome.results[0].scoring.score, WithinAbs(structured, 1e-9));
        REQUIRE_THAT(outcome.results[0].finalScore, WithinAbs(0.7 * structured + 0.2 * 0.9, 1e-9));
        REQUIRE_THAT(outcome.results[2].finalScore, WithinAbs(0.7 * (2.0 + 0.15) + 0.2 * 0.5, 1e-9));

        for (const auto& result : outcome.results) {
            REQUIRE_FALSE(result.scoring.isDisqualified);
        }
    }

    SECTION("Only the best few are kept") {
        RankingPipeline pipeline(makeConfig([](config::ScoringConfig& c) { c.ranking.finalTopN = 2; }));
        auto outcome = pipeline.rank(pool, condoNearBts());
        REQUIRE(outcome.results.size() == 2);
        REQUIRE(outcome.results[1].attributes.id == "d");
    }

    SECTION("Pool is truncated to the retrieval depth") {
        RankingPipeline pipeline(makeConfig([](config::ScoringConfig& c) { c.ranking.topKCandidates = 2; }));
        auto outcome = pipeline.rank(pool, condoNearBts());
        REQUIRE(outcome.poolSize == 2);
        REQUIRE(outcome.disqualified == 1);
        REQUIRE(outcome.results.size() == 1);
        REQUIRE(outcome.results[0].attributes.id == "a");
    }

    SECTION("JSON output") {
        RankingPipeline pipeline(makeConfig());
        auto json = pipeline.rank(pool, condoNearBts()).toJson();
        REQUIRE(json["results"].size() == 3);
        REQUIRE(json["results"][0]["id"] == "a");
        REQUIRE(json["disqualified"] == 1);
        REQUIRE_FALSE(json.contains("message"));
        REQUIRE(json["results"][0]["signals"].size() >= 2);
    }
}

TEST_CASE("Ranking quality gate", "[ranking]") {
    RankingPipeline pipeline(makeConfig());

    SECTION("Nobody survives the constraints") {
        auto pool = parsePool(nlohmann::json::array({
            wrapped("house", 0.9, {{"asset_type_id", 4}}),
            wrapped("rail", 0.9, {{"asset_type_id", 3}, {"train_station", 400}})
        }));
        auto outcome = pipeline.rank(pool, condoNearBts());
        REQUIRE_FALSE(outcome.hasResults());
        REQUIRE(outcome.disqualified == 2);
        REQUIRE_THAT(outcome.message, ContainsSubstring("No listings satisfy"));
    }

    SECTION("Empty pool") {
        auto outcome = pipeline.rank({}, condoNearBts());
        REQUIRE(outcome.poolSize == 0);
        REQUIRE_FALSE(outcome.hasResults());
        REQUIRE_FALSE(outcome.message.empty());
    }

    SECTION("Best match below the relevance floor") {
        auto pool = parsePool(nlohmann::json::array({
            wrapped("weak-1", 0.1, {{"id", "weak-1"}}),
            wrapped("weak-2", 0.3, {{"id", "weak-2"}, {"lifestyle_score", 0.2}})
        }));
        auto outcome = pipeline.rank(pool, models::Intent{});
        REQUIRE(outcome.disqualified == 0);
        REQUIRE_FALSE(outcome.hasResults());
        REQUIRE_THAT(outcome.message, ContainsSubstring("below the minimum"));
        REQUIRE(outcome.toJson().contains("message"));
    }
}

TEST_CASE("Minimum data quality filter", "[ranking]") {
    RankingPipeline pipeline(makeConfig([](config::ScoringConfig& c) {
        c.dataQuality.minQualityForInclusion = 0.5;
    }));
    auto intent = models::Intent::fromJson({{"must_have", nlohmann::json::array({"school"})}});

    auto pool = parsePool(nlohmann::json::array({
        wrapped("sparse", 0.9, {{"school", 99999}}),
        wrapped("complete", 0.6, {{"school", 500}, {"asset_type_id", 3},
                                  {"asset_details_selling_price", 4000000},
                                  {"latitude", 13.75}, {"longitude", 100.5}})
    }));
    auto outcome = pipeline.rank(pool, intent);

    REQUIRE(outcome.filteredByQuality == 1);
    REQUIRE(outcome.results.size() == 1);
    REQUIRE(outcome.results[0].attributes.id == "complete");
    REQUIRE(outcome.results[0].scoring.dataQuality->qualityScore >= 0.5);
}

TEST_CASE("Worker count does not change the ranking", "[ranking][threads]") {
    nlohmann::json raw = nlohmann::json::array();
    for (int i = 0; i < 40; ++i) {
        nlohmann::json metadata = {
            {"id", "L-" + std::to_string(i)},
            {"asset_type_id", i % 5 == 0 ? 4 : 3},
            {"bts_station", 100 + (i * 137) % 3500},
            {"school", i % 7 == 0 ? 99999 : 200 + (i * 311) % 4000},
            {"lifestyle_score", (i % 10) / 10.0}
        };
        raw.push_back(wrapped("L-" + std::to_string(i), (i % 9) / 9.0, metadata));
    }
    auto pool = parsePool(raw);
    auto intent = models::Intent::fromJson({
        {"asset_types", nlohmann::json::array({"condo"})},
        {"must_have", nlohmann::json::array({"bts_station", "school"})}
    });

    RankingPipeline single(makeConfig([](config::ScoringConfig& c) {
        c.ranking.workerThreads = 1;
        c.ranking.finalTopN = 40;
    }));
    RankingPipeline many(makeConfig([](config::ScoringConfig& c) {
        c.ranking.workerThreads = 6;
        c.ranking.finalTopN = 40;
    }));

    auto expected = single.rank(pool, intent);
    auto actual = many.rank(pool, intent);
    REQUIRE(expected.toJson() == actual.toJson());
    REQUIRE(expected.disqualified > 0);
    REQUIRE(expected.hasResults());

    for (size_t i = 1; i < actual.results.size(); ++i) {
        REQUIRE(actual.results[i - 1].finalScore >= actual.results[i].finalScore);
    }
}

TEST_CASE("Sample data files rank", "[ranking]") {
    const std::string dataDir = std::string(LISTING_RANKER_SOURCE_DIR) + "/examples/data";
    std::ifstream intentFile(dataDir + "/intent.json");
    std::ifstream candidatesFile(dataDir + "/candidates.json");
    REQUIRE(intentFile.is_open());
    REQUIRE(candidatesFile.is_open());

    nlohmann::json intentJson;
    nlohmann::json candidatesJson;
    intentFile >> intentJson;
    candidatesFile >> candidatesJson;

    RankingPipeline pipeline(makeConfig());
    auto outcome = pipeline.rank(parsePool(candidatesJson), models::Intent::fromJson(intentJson));

    // Legacy rail only, a market inside the avoid radius and a house are all gated out
    REQUIRE(outcome.poolSize == 5);
    REQUIRE(outcome.disqualified == 3);
    REQUIRE(outcome.results.size() == 2);
    REQUIRE(outcome.results[0].attributes.id == "A-1001");
    REQUIRE(outcome.results[1].attributes.id == "A-1005");
}
