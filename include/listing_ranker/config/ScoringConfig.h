#pragma once

#include "AssetTypeMapping.h"
#include "PoiCatalog.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace listing_ranker {
namespace config {

// Every tunable of the scoring engine. Built once at start-up and shared
// read-only by all scoring calls.
struct ScoringConfig {
    // Additive contributions; negative values are penalties
    struct Weights {
        double assetTypeMatch = 2.0;
        double mustHavePoiBase = 1.5;       // scaled by proximity factor
        double niceToHavePoi = 0.25;
        double petFriendlyExplicit = 1.5;
        double petFriendlyInferred = 0.5;   // low-rise housing
        double priceInRange = 0.5;
        double avoidPoiSuccess = 0.3;
        double nearVetBonus = 0.25;

        double priceOutOfRange = -3.0;
        double avoidPoiFailure = -5.0;
        double petNotAllowed = -8.0;
        double petStatusUnknown = -2.0;
        double petDisturbancePenalty = -2.0;

        // Applied instead of disqualifying when the matching hard constraint is off
        double assetTypeMismatch = -10.0;
        double wrongTransportType = -20.0;
        double mustHavePoiTooFar = -15.0;

        double locationVeryClose = 3.0;
        double locationClose = 1.5;
        double locationFar = -2.0;

        double avoidLocationHitHard = -5.0;
        double avoidLocationHitSoft = -2.0;
        double avoidLocationSuccess = 0.5;
    } weights;

    // true = gate disqualifies, false = gate applies its penalty weight
    struct HardConstraints {
        bool wrongAssetType = true;
        bool mustHavePoiTooFar = true;
        bool wrongTransportType = true;
        bool targetLocationTooFar = true;
        bool avoidPoiTooClose = true;
    } hardConstraints;

    struct TargetLocation {
        double radiusVeryClose = 2000.0;  // meters
        double radiusClose = 5000.0;
        double radiusFarLimit = 10000.0;
    } targetLocation;

    struct AvoidLocation {
        double radiusHardHit = 2000.0;
        double radiusSoftHit = 5000.0;
    } avoidLocation;

    struct DataQuality {
        std::vector<double> missingDataSentinels{99999.0};
        double nearSentinelThreshold = 90000.0;  // numeric values at or above are missing
        double minQualityForInclusion = 0.0;
    } dataQuality;

    struct Proximity {
        double avoidRadiusRatio = 0.6;       // avoid threshold = ratio * catalog radius
        double minProximityFactor = 0.1;     // floor for any verified in-range POI
        std::string legacyRailKey = "train_station";
        double legacyRailThreshold = 2500.0; // looser than the catalog radius
        std::string veterinaryKey = "veterinary";
    } proximity;

    struct Ranking {
        size_t topKCandidates = 100;
        size_t finalTopN = 5;
        double structuredWeight = 0.7;
        double semanticWeight = 0.2;
        double lifestyleWeight = 0.1;
        double minTopScore = 0.35;
        size_t workerThreads = 0;  // 0 = hardware concurrency
    } ranking;

    PoiCatalog poiCatalog = PoiCatalog::createDefault();
    AssetTypeMapping assetTypes = AssetTypeMapping::createDefault();

    static ScoringConfig createDefault();
    // All hard constraints off: gates penalize instead of disqualifying
    static ScoringConfig createLenient();

    // Overlays `json` on the defaults. Throws std::runtime_error when invalid.
    static ScoringConfig fromJson(const nlohmann::json& json);
    static ScoringConfig loadFromFile(const std::string& path);

    nlohmann::json toJson() const;
};

} // namespace config
} // namespace listing_ranker
