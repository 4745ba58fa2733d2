#include "../../include/listing_ranker/config/ScoringConfig.h"
#include "../../include/listing_ranker/config/ConfigValidator.h"
#include "../../include/listing_ranker/common/Logger.h"
#include <fstream>
#include <stdexcept>

namespace listing_ranker {
namespace config {

namespace {

void readNumber(const nlohmann::json& section, const char* field, double& out) {
    if (section.contains(field) && section[field].is_number()) {
        out = section[field].get<double>();
    }
}

void readSize(const nlohmann::json& section, const char* field, size_t& out) {
    if (section.contains(field) && section[field].is_number_unsigned()) {
        out = section[field].get<size_t>();
    }
}

void readBool(const nlohmann::json& section, const char* field, bool& out) {
    if (section.contains(field) && section[field].is_boolean()) {
        out = section[field].get<bool>();
    }
}

void readString(const nlohmann::json& section, const char* field, std::string& out) {
    if (section.contains(field) && section[field].is_string()) {
        out = section[field].get<std::string>();
    }
}

} // namespace

ScoringConfig ScoringConfig::createDefault() {
    return ScoringConfig();
}

ScoringConfig ScoringConfig::createLenient() {
    ScoringConfig config;
    config.hardConstraints.wrongAssetType = false;
    config.hardConstraints.mustHavePoiTooFar = false;
    config.hardConstraints.wrongTransportType = false;
    config.hardConstraints.targetLocationTooFar = false;
    config.hardConstraints.avoidPoiTooClose = false;
    return config;
}

ScoringConfig ScoringConfig::fromJson(const nlohmann::json& json) {
    ValidationResult validation = validateConfigJson(json);
    if (!validation.valid) {
        throw std::runtime_error("Invalid scoring config: " + validation.message);
    }

    ScoringConfig config;

    if (json.contains("scoring_weights")) {
        const auto& w = json["scoring_weights"];
        auto& weights = config.weights;
        readNumber(w, "asset_type_match", weights.assetTypeMatch);
        readNumber(w, "must_have_poi_base", weights.mustHavePoiBase);
        readNumber(w, "nice_to_have_poi", weights.niceToHavePoi);
        readNumber(w, "pet_friendly_explicit", weights.petFriendlyExplicit);
        readNumber(w, "pet_friendly_inferred", weights.petFriendlyInferred);
        readNumber(w, "price_in_range", weights.priceInRange);
        readNumber(w, "avoid_poi_success", weights.avoidPoiSuccess);
        readNumber(w, "near_vet_bonus", weights.nearVetBonus);
        readNumber(w, "price_out_of_range", weights.priceOutOfRange);
        readNumber(w, "avoid_poi_failure", weights.avoidPoiFailure);
        // Older configs name the pet penalty after condominiums; the current name wins
        readNumber(w, "pet_not_allowed_condo", weights.petNotAllowed);
        readNumber(w, "pet_not_allowed", weights.petNotAllowed);
        readNumber(w, "pet_status_unknown", weights.petStatusUnknown);
        readNumber(w, "pet_disturbance_penalty", weights.petDisturbancePenalty);
        readNumber(w, "asset_type_mismatch", weights.assetTypeMismatch);
        readNumber(w, "wrong_transport_type", weights.wrongTransportType);
        readNumber(w, "must_have_poi_too_far", weights.mustHavePoiTooFar);
        readNumber(w, "location_very_close", weights.locationVeryClose);
        readNumber(w, "location_close", weights.locationClose);
        readNumber(w, "location_far", weights.locationFar);
        readNumber(w, "avoid_location_hit_hard", weights.avoidLocationHitHard);
        readNumber(w, "avoid_location_hit_soft", weights.avoidLocationHitSoft);
        readNumber(w, "avoid_location_success", weights.avoidLocationSuccess);
    }

    if (json.contains("hard_constraints")) {
        const auto& h = json["hard_constraints"];
        auto& hard = config.hardConstraints;
        readBool(h, "wrong_asset_type", hard.wrongAssetType);
        readBool(h, "must_have_poi_too_far", hard.mustHavePoiTooFar);
        readBool(h, "wrong_transport_type", hard.wrongTransportType);
        readBool(h, "target_location_too_far", hard.targetLocationTooFar);
        readBool(h, "avoid_poi_too_close", hard.avoidPoiTooClose);
    }

    if (json.contains("target_location")) {
        const auto& t = json["target_location"];
        readNumber(t, "radius_very_close", config.targetLocation.radiusVeryClose);
        readNumber(t, "radius_close", config.targetLocation.radiusClose);
        readNumber(t, "radius_far_limit", config.targetLocation.radiusFarLimit);
    }

    if (json.contains("avoid_location")) {
        const auto& a = json["avoid_location"];
        readNumber(a, "radius_hard_hit", config.avoidLocation.radiusHardHit);
        readNumber(a, "radius_soft_hit", config.avoidLocation.radiusSoftHit);
    }

    if (json.contains("data_quality")) {
        const auto& d = json["data_quality"];
        if (d.contains("missing_data_sentinels")) {
            config.dataQuality.missingDataSentinels.clear();
            for (const auto& s : d["missing_data_sentinels"]) {
                // null is always treated as missing, so only numbers are kept
                if (s.is_number()) {
                    config.dataQuality.missingDataSentinels.push_back(s.get<double>());
                }
            }
        }
        readNumber(d, "near_sentinel_threshold", config.dataQuality.nearSentinelThreshold);
        readNumber(d, "min_quality_for_inclusion", config.dataQuality.minQualityForInclusion);
    }

    if (json.contains("proximity")) {
        const auto& p = json["proximity"];
        readNumber(p, "avoid_radius_ratio", config.proximity.avoidRadiusRatio);
        readNumber(p, "min_proximity_factor", config.proximity.minProximityFactor);
        readString(p, "legacy_rail_key", config.proximity.legacyRailKey);
        readNumber(p, "legacy_rail_threshold", config.proximity.legacyRailThreshold);
        readString(p, "veterinary_key", config.proximity.veterinaryKey);
    }

    if (json.contains("ranking")) {
        const auto& r = json["ranking"];
        readSize(r, "top_k_candidates", config.ranking.topKCandidates);
        readSize(r, "final_top_n", config.ranking.finalTopN);
        readNumber(r, "structured_weight", config.ranking.structuredWeight);
        readNumber(r, "semantic_weight", config.ranking.semanticWeight);
        readNumber(r, "lifestyle_weight", config.ranking.lifestyleWeight);
        readNumber(r, "min_top_score", config.ranking.minTopScore);
        readSize(r, "worker_threads", config.ranking.workerThreads);
    }

    if (json.contains("poi_catalog")) {
        config.poiCatalog = config.poiCatalog.withOverrides(json["poi_catalog"]);
    }

    if (json.contains("asset_types")) {
        config.assetTypes = config.assetTypes.withOverrides(json["asset_types"]);
    }

    return config;
}

ScoringConfig ScoringConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open scoring config file: " + path);
        throw std::runtime_error("Failed to open scoring config file: " + path);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Failed to parse scoring config " + path + ": " + e.what());
        throw std::runtime_error("Failed to parse JSON config: " + std::string(e.what()));
    }

    ScoringConfig config = fromJson(json);
    LOG_INFO("Loaded scoring config from " + path + " (" +
             std::to_string(config.poiCatalog.size()) + " POI definitions, " +
             std::to_string(config.assetTypes.labels().size()) + " asset type labels)");
    return config;
}

nlohmann::json ScoringConfig::toJson() const {
    nlohmann::json j;
    j["scoring_weights"] = {
        {"asset_type_match", weights.assetTypeMatch},
        {"must_have_poi_base", weights.mustHavePoiBase},
        {"nice_to_have_poi", weights.niceToHavePoi},
        {"pet_friendly_explicit", weights.petFriendlyExplicit},
        {"pet_friendly_inferred", weights.petFriendlyInferred},
        {"price_in_range", weights.priceInRange},
        {"avoid_poi_success", weights.avoidPoiSuccess},
        {"near_vet_bonus", weights.nearVetBonus},
        {"price_out_of_range", weights.priceOutOfRange},
        {"avoid_poi_failure", weights.avoidPoiFailure},
        {"pet_not_allowed", weights.petNotAllowed},
        {"pet_status_unknown", weights.petStatusUnknown},
        {"pet_disturbance_penalty", weights.petDisturbancePenalty},
        {"asset_type_mismatch", weights.assetTypeMismatch},
        {"wrong_transport_type", weights.wrongTransportType},
        {"must_have_poi_too_far", weights.mustHavePoiTooFar},
        {"location_very_close", weights.locationVeryClose},
        {"location_close", weights.locationClose},
        {"location_far", weights.locationFar},
        {"avoid_location_hit_hard", weights.avoidLocationHitHard},
        {"avoid_location_hit_soft", weights.avoidLocationHitSoft},
        {"avoid_location_success", weights.avoidLocationSuccess}
    };
    j["hard_constraints"] = {
        {"wrong_asset_type", hardConstraints.wrongAssetType},
        {"must_have_poi_too_far", hardConstraints.mustHavePoiTooFar},
        {"wrong_transport_type", hardConstraints.wrongTransportType},
        {"target_location_too_far", hardConstraints.targetLocationTooFar},
        {"avoid_poi_too_close", hardConstraints.avoidPoiTooClose}
    };
    j["target_location"] = {
        {"radius_very_close", targetLocation.radiusVeryClose},
        {"radius_close", targetLocation.radiusClose},
        {"radius_far_limit", targetLocation.radiusFarLimit}
    };
    j["avoid_location"] = {
        {"radius_hard_hit", avoidLocation.radiusHardHit},
        {"radius_soft_hit", avoidLocation.radiusSoftHit}
    };
    j["data_quality"] = {
        {"missing_data_sentinels", dataQuality.missingDataSentinels},
        {"near_sentinel_threshold", dataQuality.nearSentinelThreshold},
        {"min_quality_for_inclusion", dataQuality.minQualityForInclusion}
    };
    j["proximity"] = {
        {"avoid_radius_ratio", proximity.avoidRadiusRatio},
        {"min_proximity_factor", proximity.minProximityFactor},
        {"legacy_rail_key", proximity.legacyRailKey},
        {"legacy_rail_threshold", proximity.legacyRailThreshold},
        {"veterinary_key", proximity.veterinaryKey}
    };
    j["ranking"] = {
        {"top_k_candidates", ranking.topKCandidates},
        {"final_top_n", ranking.finalTopN},
        {"structured_weight", ranking.structuredWeight},
        {"semantic_weight", ranking.semanticWeight},
        {"lifestyle_weight", ranking.lifestyleWeight},
        {"min_top_score", ranking.minTopScore},
        {"worker_threads", ranking.workerThreads}
    };
    j["poi_catalog"] = poiCatalog.toJson();
    j["asset_types"] = assetTypes.toJson();
    return j;
}

} // namespace config
} // namespace listing_ranker
