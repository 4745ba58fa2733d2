#include "../../include/listing_ranker/config/PoiCatalog.h"
#include "../../include/listing_ranker/common/Logger.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace listing_ranker {
namespace config {

std::optional<CurveType> parseCurveType(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "linear") return CurveType::LINEAR;
    if (lower == "exponential") return CurveType::EXPONENTIAL;
    return std::nullopt;
}

std::string curveTypeToString(CurveType curve) {
    switch (curve) {
        case CurveType::LINEAR: return "linear";
        case CurveType::EXPONENTIAL: return "exponential";
    }
    return "linear";
}

PoiCatalog::PoiCatalog(std::vector<PoiDefinition> definitions)
    : definitions_(std::move(definitions)) {
    rebuildIndex();
}

void PoiCatalog::rebuildIndex() {
    index_.clear();
    for (size_t i = 0; i < definitions_.size(); ++i) {
        index_[definitions_[i].key] = i;
    }
}

PoiCatalog PoiCatalog::createDefault() {
    using C = CurveType;
    return PoiCatalog({
        // Transportation
        {"bts_station", 3000, 1.2, C::EXPONENTIAL, "transportation", "BTS Skytrain station", true},
        {"mrt", 3000, 1.2, C::EXPONENTIAL, "transportation", "MRT subway station", true},
        {"train_station", 2000, 0.5, C::EXPONENTIAL, "transportation", "State Railway station", false},
        {"bus_station", 2000, 0.5, C::EXPONENTIAL, "transportation", "Bus terminal", false},

        // Shopping
        {"convenience_store", 3000, 0.5, C::EXPONENTIAL, "shopping", "Convenience store", false},
        {"market", 1500, 0.4, C::LINEAR, "shopping", "Fresh market", false},
        {"supermarket", 2000, 0.5, C::LINEAR, "shopping", "Supermarket", false},
        {"shopping_mall", 3000, 1.1, C::LINEAR, "shopping", "Shopping mall", false},
        {"community_mall", 2000, 0.7, C::LINEAR, "shopping", "Community mall", false},

        // Dining
        {"restaurant", 1000, 0.4, C::LINEAR, "dining", "Restaurant", false},
        {"cafe", 1000, 0.4, C::LINEAR, "dining", "Cafe", false},

        // Health and recreation
        {"hospital", 3000, 0.7, C::LINEAR, "health", "Hospital", false},
        {"park", 3000, 0.6, C::LINEAR, "recreation", "Public park", false},
        {"gym", 2000, 0.5, C::LINEAR, "health", "Gym / fitness center", false},
        {"spa", 2000, 0.2, C::LINEAR, "health", "Spa / massage", false},
        {"veterinary", 2000, 0.5, C::LINEAR, "pet", "Veterinary clinic", false},

        // Education and culture
        {"school", 3000, 0.5, C::LINEAR, "education", "School", false},
        {"university", 3000, 0.3, C::LINEAR, "education", "University", false},
        {"temple", 1500, 0.1, C::LINEAR, "culture", "Temple", false},
        {"museum", 5000, 0.1, C::LINEAR, "culture", "Museum", false},

        // Nature and tourism
        {"river", 1500, 0.4, C::LINEAR, "nature", "Riverside", false},
        {"beach", 3000, 0.0, C::LINEAR, "nature", "Beach", false},
        {"viewpoint", 3000, 0.2, C::LINEAR, "tourism", "Viewpoint", false},
        {"tourist_attraction", 3000, 0.2, C::LINEAR, "tourism", "Tourist attraction", false},
        {"hotel", 2000, 0.1, C::LINEAR, "tourism", "Hotel", false},
        {"golf_course", 5000, 0.2, C::LINEAR, "recreation", "Golf course", false},
    });
}

PoiCatalog PoiCatalog::withOverrides(const nlohmann::json& overrides) const {
    if (!overrides.is_object()) {
        throw std::runtime_error("poi_catalog must be a JSON object keyed by POI key");
    }

    std::vector<PoiDefinition> merged = definitions_;
    auto indexOf = [&merged](const std::string& key) -> std::optional<size_t> {
        for (size_t i = 0; i < merged.size(); ++i) {
            if (merged[i].key == key) return i;
        }
        return std::nullopt;
    };

    for (const auto& [key, entry] : overrides.items()) {
        if (!entry.is_object()) {
            throw std::runtime_error("poi_catalog." + key + " must be an object");
        }

        PoiDefinition def;
        auto existing = indexOf(key);
        if (existing) {
            def = merged[*existing];
        } else {
            def.key = key;
            def.displayName = key;
        }

        if (entry.contains("radius")) {
            if (!entry["radius"].is_number() || entry["radius"].get<double>() <= 0) {
                throw std::runtime_error("poi_catalog." + key + ".radius must be a positive number");
            }
            def.radius = entry["radius"].get<double>();
        }
        if (entry.contains("weight")) {
            if (!entry["weight"].is_number() || entry["weight"].get<double>() < 0) {
                throw std::runtime_error("poi_catalog." + key + ".weight must be a non-negative number");
            }
            def.weight = entry["weight"].get<double>();
        }
        if (entry.contains("curve")) {
            auto curve = entry["curve"].is_string()
                ? parseCurveType(entry["curve"].get<std::string>())
                : std::nullopt;
            if (!curve) {
                throw std::runtime_error("poi_catalog." + key + ".curve must be \"linear\" or \"exponential\"");
            }
            def.curve = *curve;
        }
        if (entry.contains("category") && entry["category"].is_string()) {
            def.category = entry["category"].get<std::string>();
        }
        if (entry.contains("display_name") && entry["display_name"].is_string()) {
            def.displayName = entry["display_name"].get<std::string>();
        }
        // Legacy catalogs tag transit class through poi_type
        if (entry.contains("poi_type") && entry["poi_type"].is_string()) {
            def.isRapidTransit = entry["poi_type"].get<std::string>() == "rapid_transit";
        }
        if (entry.contains("is_rapid_transit")) {
            if (!entry["is_rapid_transit"].is_boolean()) {
                throw std::runtime_error("poi_catalog." + key + ".is_rapid_transit must be a boolean");
            }
            def.isRapidTransit = entry["is_rapid_transit"].get<bool>();
        }

        if (existing) {
            merged[*existing] = def;
        } else {
            merged.push_back(def);
        }
    }

    LOG_DEBUG("POI catalog overrides applied: " + std::to_string(overrides.size()) +
              " entries, catalog size " + std::to_string(merged.size()));
    return PoiCatalog(std::move(merged));
}

const PoiDefinition* PoiCatalog::find(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &definitions_[it->second];
}

std::string PoiCatalog::displayName(const std::string& key) const {
    const PoiDefinition* def = find(key);
    if (!def || def->displayName.empty()) {
        return key;
    }
    return def->displayName;
}

bool PoiCatalog::isRapidTransit(const std::string& key) const {
    const PoiDefinition* def = find(key);
    return def != nullptr && def->isRapidTransit;
}

std::vector<std::string> PoiCatalog::rapidTransitKeys() const {
    std::vector<std::string> keys;
    for (const auto& def : definitions_) {
        if (def.isRapidTransit) {
            keys.push_back(def.key);
        }
    }
    return keys;
}

nlohmann::json PoiCatalog::toJson() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& def : definitions_) {
        j[def.key] = {
            {"radius", def.radius},
            {"weight", def.weight},
            {"curve", curveTypeToString(def.curve)},
            {"category", def.category},
            {"display_name", def.displayName},
            {"is_rapid_transit", def.isRapidTransit}
        };
    }
    return j;
}

} // namespace config
} // namespace listing_ranker
