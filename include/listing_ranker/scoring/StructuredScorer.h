#pragma once

#include "../config/ScoringConfig.h"
#include "../geo/GeoDistance.h"
#include "../models/CandidateAttributes.h"
#include "../models/DataQualityReport.h"
#include "../models/Intent.h"
#include "../models/ScoringResult.h"
#include "../quality/DataQualityAssessor.h"
#include <memory>
#include <optional>
#include <string>

namespace listing_ranker {
namespace scoring {

/**
 * Constraint-gated multi-factor relevance scorer.
 *
 * Runs a fixed sequence of checks against one candidate. Hard gates end the
 * sequence with a disqualification; every other check adds a signed
 * contribution and an itemized signal. Distances are only ever read through
 * DataQualityAssessor::verifiedDistance, so missing data produces warnings
 * rather than penalties.
 *
 * Stateless apart from the shared read-only config: safe to call from any
 * number of threads at once.
 */
class StructuredScorer {
public:
    explicit StructuredScorer(std::shared_ptr<const config::ScoringConfig> config);

    // Never throws. Coordinates are optional; absent ones skip the location checks.
    models::ScoringResult score(const models::CandidateAttributes& attributes,
                                const models::Intent& intent,
                                const models::DataQualityReport& quality,
                                const std::optional<geo::Coordinates>& targetCoords = std::nullopt,
                                const std::optional<geo::Coordinates>& avoidCoords = std::nullopt) const;

    const config::ScoringConfig& config() const { return *config_; }
    const quality::DataQualityAssessor& assessor() const { return assessor_; }

private:
    std::shared_ptr<const config::ScoringConfig> config_;
    quality::DataQualityAssessor assessor_;

    // Gates return false once the candidate has been disqualified
    bool checkAssetType(const models::CandidateAttributes& attributes,
                        const models::Intent& intent,
                        models::ScoringResult& result) const;
    bool checkTransportType(const models::CandidateAttributes& attributes,
                            const models::Intent& intent,
                            models::ScoringResult& result) const;
    void scoreRapidTransit(const models::CandidateAttributes& attributes,
                           const models::Intent& intent,
                           models::ScoringResult& result) const;
    bool checkMustHavePois(const models::CandidateAttributes& attributes,
                           const models::Intent& intent,
                           models::ScoringResult& result) const;
    void scorePetFriendly(const models::CandidateAttributes& attributes,
                          const models::Intent& intent,
                          models::ScoringResult& result) const;
    void scoreNiceToHave(const models::CandidateAttributes& attributes,
                         const models::Intent& intent,
                         models::ScoringResult& result) const;
    bool checkAvoidPois(const models::CandidateAttributes& attributes,
                        const models::Intent& intent,
                        models::ScoringResult& result) const;
    void scorePriceRange(const models::CandidateAttributes& attributes,
                         const models::Intent& intent,
                         models::ScoringResult& result) const;
    bool scoreTargetLocation(const models::CandidateAttributes& attributes,
                             const geo::Coordinates& target,
                             models::ScoringResult& result) const;
    void scoreAvoidLocation(const models::CandidateAttributes& attributes,
                            const geo::Coordinates& avoid,
                            models::ScoringResult& result) const;

    // Contribution for a verified in-range POI: base weight scaled by floored proximity
    double proximityContribution(const config::PoiDefinition& poi, double distance) const;

    // Warning for a key whose distance could not be verified
    void warnUnverified(const models::CandidateAttributes& attributes,
                        const std::string& key,
                        const std::string& label,
                        models::ScoringResult& result) const;

    void disqualify(const models::CandidateAttributes& attributes,
                    const std::string& reason,
                    models::ScoringResult& result) const;
};

} // namespace scoring
} // namespace listing_ranker
