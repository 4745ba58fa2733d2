#pragma once

#include <nlohmann/json.hpp>
#include <initializer_list>
#include <string>

namespace listing_ranker {
namespace config {

struct ValidationResult {
    bool valid;
    std::string message;
};

// Structural checks on a configuration document before any value is applied.
// Catalog and asset-type sections validate themselves while merging.
inline ValidationResult validateConfigJson(const nlohmann::json& body) {
    if (!body.is_object()) return {false, "Configuration must be a JSON object"};

    auto checkSection = [&body](const char* name) -> ValidationResult {
        if (body.contains(name) && !body[name].is_object()) {
            return {false, std::string(name) + " must be an object"};
        }
        return {true, "ok"};
    };
    for (const char* section : {"scoring_weights", "hard_constraints", "target_location",
                                "avoid_location", "data_quality", "proximity", "ranking",
                                "poi_catalog", "asset_types"}) {
        auto res = checkSection(section);
        if (!res.valid) return res;
    }

    if (body.contains("scoring_weights")) {
        for (const auto& [name, value] : body["scoring_weights"].items()) {
            if (!value.is_number()) {
                return {false, "scoring_weights." + name + " must be a number"};
            }
        }
    }

    if (body.contains("hard_constraints")) {
        for (const auto& [name, value] : body["hard_constraints"].items()) {
            if (!value.is_boolean()) {
                return {false, "hard_constraints." + name + " must be a boolean"};
            }
        }
    }

    auto positive = [](const nlohmann::json& section, const char* field, double& out) -> ValidationResult {
        if (!section.contains(field)) return {true, "ok"};
        if (!section[field].is_number() || section[field].get<double>() <= 0) {
            return {false, std::string(field) + " must be a positive number"};
        }
        out = section[field].get<double>();
        return {true, "ok"};
    };

    if (body.contains("target_location")) {
        const auto& tl = body["target_location"];
        double veryClose = 2000.0, close = 5000.0, farLimit = 10000.0;
        for (auto res : {positive(tl, "radius_very_close", veryClose),
                         positive(tl, "radius_close", close),
                         positive(tl, "radius_far_limit", farLimit)}) {
            if (!res.valid) return {false, "target_location." + res.message};
        }
        if (!(veryClose <= close && close <= farLimit)) {
            return {false, "target_location radii must satisfy very_close <= close <= far_limit"};
        }
    }

    if (body.contains("avoid_location")) {
        const auto& al = body["avoid_location"];
        double hard = 2000.0, soft = 5000.0;
        for (auto res : {positive(al, "radius_hard_hit", hard),
                         positive(al, "radius_soft_hit", soft)}) {
            if (!res.valid) return {false, "avoid_location." + res.message};
        }
        if (hard > soft) {
            return {false, "avoid_location radii must satisfy hard_hit <= soft_hit"};
        }
    }

    if (body.contains("proximity")) {
        const auto& px = body["proximity"];
        if (px.contains("avoid_radius_ratio")) {
            if (!px["avoid_radius_ratio"].is_number()) {
                return {false, "proximity.avoid_radius_ratio must be a number"};
            }
            double ratio = px["avoid_radius_ratio"].get<double>();
            if (ratio <= 0 || ratio > 1) {
                return {false, "proximity.avoid_radius_ratio must be in (0, 1]"};
            }
        }
        if (px.contains("min_proximity_factor")) {
            if (!px["min_proximity_factor"].is_number()) {
                return {false, "proximity.min_proximity_factor must be a number"};
            }
            double floor = px["min_proximity_factor"].get<double>();
            if (floor < 0 || floor > 1) {
                return {false, "proximity.min_proximity_factor must be in [0, 1]"};
            }
        }
        double threshold = 2500.0;
        auto res = positive(px, "legacy_rail_threshold", threshold);
        if (!res.valid) return {false, "proximity." + res.message};
        for (const char* key : {"legacy_rail_key", "veterinary_key"}) {
            if (px.contains(key) && !px[key].is_string()) {
                return {false, std::string("proximity.") + key + " must be a string"};
            }
        }
    }

    if (body.contains("data_quality")) {
        const auto& dq = body["data_quality"];
        if (dq.contains("missing_data_sentinels")) {
            const auto& sentinels = dq["missing_data_sentinels"];
            if (!sentinels.is_array()) {
                return {false, "data_quality.missing_data_sentinels must be an array"};
            }
            for (const auto& s : sentinels) {
                if (!s.is_number() && !s.is_null()) {
                    return {false, "data_quality.missing_data_sentinels must contain numbers"};
                }
            }
        }
        double threshold = 90000.0;
        auto res = positive(dq, "near_sentinel_threshold", threshold);
        if (!res.valid) return {false, "data_quality." + res.message};
        if (dq.contains("min_quality_for_inclusion")) {
            if (!dq["min_quality_for_inclusion"].is_number()) {
                return {false, "data_quality.min_quality_for_inclusion must be a number"};
            }
            double minQuality = dq["min_quality_for_inclusion"].get<double>();
            if (minQuality < 0 || minQuality > 1) {
                return {false, "data_quality.min_quality_for_inclusion must be in [0, 1]"};
            }
        }
    }

    if (body.contains("ranking")) {
        const auto& rk = body["ranking"];
        for (const char* field : {"structured_weight", "semantic_weight", "lifestyle_weight"}) {
            if (rk.contains(field) && (!rk[field].is_number() || rk[field].get<double>() < 0)) {
                return {false, std::string("ranking.") + field + " must be a non-negative number"};
            }
        }
        for (const char* field : {"top_k_candidates", "final_top_n", "worker_threads"}) {
            if (rk.contains(field) && !rk[field].is_number_unsigned()) {
                return {false, std::string("ranking.") + field + " must be a non-negative integer"};
            }
        }
        if (rk.contains("min_top_score") && !rk["min_top_score"].is_number()) {
            return {false, "ranking.min_top_score must be a number"};
        }
    }

    return {true, "ok"};
}

} // namespace config
} // namespace listing_ranker
