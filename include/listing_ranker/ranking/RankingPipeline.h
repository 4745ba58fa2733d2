#pragma once

#include "../config/ScoringConfig.h"
#include "../geo/GeoDistance.h"
#include "../models/CandidateAttributes.h"
#include "../models/Intent.h"
#include "../models/ScoringResult.h"
#include "../scoring/StructuredScorer.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace listing_ranker {
namespace ranking {

// One listing from the externally retrieved pool
struct RankingCandidate {
    models::CandidateAttributes attributes;
    double semanticScore = 0.0;  // [0, 1], from vector retrieval
};

struct RankedResult {
    models::CandidateAttributes attributes;
    models::ScoringResult scoring;
    double semanticScore = 0.0;
    double finalScore = 0.0;
    size_t inputIndex = 0;  // position in the retrieved pool

    nlohmann::json toJson() const;
};

struct RankingOutcome {
    std::vector<RankedResult> results;  // best first, at most finalTopN
    std::string message;                // set when no result passed the quality gate

    size_t poolSize = 0;
    size_t disqualified = 0;
    size_t filteredByQuality = 0;

    bool hasResults() const { return !results.empty(); }
    nlohmann::json toJson() const;
};

/**
 * Thin batch step around the scorer: assess and score every candidate of a
 * retrieved pool, drop the disqualified ones, blend the structured score
 * with the retrieval and lifestyle scores, then keep the best few.
 *
 * Candidates are scored on worker threads; each task writes only its own
 * slot, so no locking is needed before the final sort.
 */
class RankingPipeline {
public:
    explicit RankingPipeline(std::shared_ptr<const config::ScoringConfig> config);

    RankingOutcome rank(const std::vector<RankingCandidate>& candidates,
                        const models::Intent& intent,
                        const std::optional<geo::Coordinates>& targetCoords = std::nullopt,
                        const std::optional<geo::Coordinates>& avoidCoords = std::nullopt) const;

    double combineScores(double structuredScore, double semanticScore, double lifestyleScore) const;

    // Accepts a flat record or the retrieval wrapper {id, semantic_score, metadata}.
    // Returns nullopt for anything that is not a JSON object.
    static std::optional<RankingCandidate> parseCandidate(const nlohmann::json& json,
                                                          const config::PoiCatalog& catalog);
    // Non-object entries are skipped with a warning
    static std::vector<RankingCandidate> parseCandidates(const nlohmann::json& json,
                                                         const config::PoiCatalog& catalog);

    const scoring::StructuredScorer& scorer() const { return scorer_; }

private:
    std::shared_ptr<const config::ScoringConfig> config_;
    scoring::StructuredScorer scorer_;

    size_t workerCount(size_t taskCount) const;
};

} // namespace ranking
} // namespace listing_ranker
