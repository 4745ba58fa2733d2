#include "../include/listing_ranker/config/ScoringConfig.h"
#include "../include/listing_ranker/models/Intent.h"
#include "../include/listing_ranker/quality/DataQualityAssessor.h"
#include "../include/listing_ranker/ranking/RankingPipeline.h"
#include "../include/listing_ranker/scoring/StructuredScorer.h"
#include "../include/listing_ranker/common/Logger.h"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace listing_ranker;

namespace {

void printResult(const std::string& title, const models::ScoringResult& result) {
    std::cout << "   " << title << ": ";
    if (result.isDisqualified) {
        std::cout << "DISQUALIFIED (" << *result.disqualificationReason << ")\n";
    } else {
        std::cout << std::fixed << std::setprecision(3) << result.score << "\n";
    }
    for (const auto& signal : result.positiveSignals) {
        std::cout << "      " << models::renderSignal(signal) << "\n";
    }
    for (const auto& signal : result.negativeSignals) {
        std::cout << "      " << models::renderSignal(signal) << "\n";
    }
}

models::CandidateAttributes makeCandidate(const nlohmann::json& json, const config::ScoringConfig& config) {
    return models::CandidateAttributes::fromJson(json, config.poiCatalog);
}

} // namespace

void demonstrateGates() {
    std::cout << "\n=== Constraint-Gated Listing Scoring Demo ===\n\n";

    auto strict = std::make_shared<const config::ScoringConfig>(config::ScoringConfig::createDefault());
    auto lenient = std::make_shared<const config::ScoringConfig>(config::ScoringConfig::createLenient());

    std::cout << "1. Configurations:\n";
    std::cout << "   Default: hard constraints on, must-have base weight = "
              << strict->weights.mustHavePoiBase << "\n";
    std::cout << "   Lenient: hard constraints off, too-far penalty = "
              << lenient->weights.mustHavePoiTooFar << "\n";

    scoring::StructuredScorer strictScorer(strict);
    scoring::StructuredScorer lenientScorer(lenient);

    models::Intent intent = models::Intent::fromJson({
        {"asset_types", {"condo"}},
        {"must_have", {"bts_station", "school"}},
        {"avoid_poi", {"market"}},
        {"price_range", {{"min", 3000000}, {"max", 5000000}}}
    });

    std::cout << "\n2. Scoring individual listings:\n";

    auto nearBts = makeCandidate({
        {"id", "near-bts"}, {"asset_type_id", 3}, {"asset_type_fixed", "Condominium"},
        {"bts_station", 400}, {"bts_station_name", "Asok"}, {"school", 800},
        {"market", 1400}, {"asset_details_selling_price", 5000000}
    }, *strict);
    auto quality = strictScorer.assessor().assess(nearBts, intent.mustHave, intent.avoidPoi);
    printResult("Condo 400 m from BTS", strictScorer.score(nearBts, intent, quality));

    auto railOnly = makeCandidate({
        {"id", "rail-only"}, {"asset_type_id", 12}, {"train_station", 1800}, {"school", 99999}
    }, *strict);
    quality = strictScorer.assessor().assess(railOnly, intent.mustHave, intent.avoidPoi);
    printResult("Condo near legacy rail only (strict)", strictScorer.score(railOnly, intent, quality));
    printResult("Condo near legacy rail only (lenient)", lenientScorer.score(railOnly, intent, quality));

    auto schoolMissing = makeCandidate({
        {"id", "school-missing"}, {"asset_type_id", 3}, {"bts_station", 1200}
    }, *strict);
    quality = strictScorer.assessor().assess(schoolMissing, intent.mustHave, intent.avoidPoi);
    std::cout << "   Data quality for school-missing: " << quality.qualityScore
              << " (" << quality.missingPoiKeys.size() << " keys missing)\n";
    printResult("Condo without school data", strictScorer.score(schoolMissing, intent, quality));

    std::cout << "\n3. Ranking a retrieved pool:\n";

    ranking::RankingPipeline pipeline(strict);
    nlohmann::json pool = nlohmann::json::array({
        {{"id", "p1"}, {"semantic_score", 0.9}, {"metadata", {{"asset_type_id", 3}, {"bts_station", 300}, {"lifestyle_score", 0.7}}}},
        {{"id", "p2"}, {"semantic_score", 0.8}, {"metadata", {{"asset_type_id", 4}, {"bts_station", 300}}}},
        {{"id", "p3"}, {"semantic_score", 0.7}, {"metadata", {{"asset_type_id", 12}, {"bts_station", 2500}, {"school", 1000}}}}
    });
    auto candidates = ranking::RankingPipeline::parseCandidates(pool, strict->poiCatalog);

    models::Intent poolIntent = models::Intent::fromJson({
        {"asset_types", {"condo"}},
        {"must_have", {"bts_station"}}
    });
    auto outcome = pipeline.rank(candidates, poolIntent);

    std::cout << "   Pool: " << outcome.poolSize << ", disqualified: " << outcome.disqualified << "\n";
    for (const auto& ranked : outcome.results) {
        std::cout << "   " << ranked.attributes.id << " final=" << std::fixed << std::setprecision(3)
                  << ranked.finalScore << " structured=" << ranked.scoring.score << "\n";
    }
    if (!outcome.message.empty()) {
        std::cout << "   " << outcome.message << "\n";
    }
}

// Ranks the sample intent and candidates shipped in examples/data
void demonstrateDataFiles(const std::string& dataDir) {
    std::cout << "\n4. Ranking the sample files in " << dataDir << ":\n";

    std::ifstream intentFile(dataDir + "/intent.json");
    std::ifstream candidatesFile(dataDir + "/candidates.json");
    if (!intentFile.is_open() || !candidatesFile.is_open()) {
        std::cout << "   Sample files not found; pass the data directory as the first argument\n";
        return;
    }

    nlohmann::json intentJson;
    nlohmann::json candidatesJson;
    try {
        intentFile >> intentJson;
        candidatesFile >> candidatesJson;
    } catch (const nlohmann::json::exception& e) {
        std::cout << "   Could not parse sample files: " << e.what() << "\n";
        return;
    }

    auto settings = std::make_shared<const config::ScoringConfig>(config::ScoringConfig::createDefault());
    ranking::RankingPipeline pipeline(settings);
    auto candidates = ranking::RankingPipeline::parseCandidates(candidatesJson, settings->poiCatalog);
    auto intent = models::Intent::fromJson(intentJson);

    // Roughly Siam Paragon, standing in for the geocoder
    geo::Coordinates target{13.7462, 100.5347};
    auto outcome = pipeline.rank(candidates, intent, target);

    std::cout << "   Pool: " << outcome.poolSize << ", disqualified: " << outcome.disqualified << "\n";
    for (const auto& ranked : outcome.results) {
        std::cout << "   " << ranked.attributes.id << " final=" << std::fixed << std::setprecision(3)
                  << ranked.finalScore << "\n";
        for (const auto& signal : ranked.scoring.positiveSignals) {
            std::cout << "      " << models::renderSignal(signal) << "\n";
        }
        for (const auto& signal : ranked.scoring.negativeSignals) {
            std::cout << "      " << models::renderSignal(signal) << "\n";
        }
    }
    if (!outcome.message.empty()) {
        std::cout << "   " << outcome.message << "\n";
    }
}

int main(int argc, char* argv[]) {
    Logger::getInstance().init(LogLevel::WARNING, true);

    demonstrateGates();
    demonstrateDataFiles(argc > 1 ? argv[1] : LISTING_RANKER_EXAMPLE_DATA_DIR);

    std::cout << "\n=== Demo Complete ===\n";
    return 0;
}
