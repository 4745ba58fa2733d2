#pragma once

#include "../geo/GeoDistance.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace listing_ranker {
namespace config {
class PoiCatalog;
}

namespace models {

// A field value exactly as the listing store delivered it.
// A key with no RawValue at all means the field was absent.
struct RawValue {
    enum class Kind {
        Null,
        Number,
        Text    // anything that is not a usable number
    };

    Kind kind = Kind::Null;
    double number = 0.0;
    std::string text;

    static RawValue null() { return RawValue{}; }
    static RawValue fromNumber(double value) { return RawValue{Kind::Number, value, {}}; }
    static RawValue fromText(std::string value) { return RawValue{Kind::Text, 0.0, std::move(value)}; }

    bool isNumber() const { return kind == Kind::Number; }
};

// Read-only snapshot of one listing's attributes
struct CandidateAttributes {
    std::string id;

    std::optional<int> assetTypeId;
    std::string assetTypeName;

    // Distances in meters keyed by catalog POI key
    std::unordered_map<std::string, RawValue> poiValues;
    // Specific place names, e.g. the station a distance was measured to
    std::unordered_map<std::string, std::string> poiNames;

    std::optional<bool> petFriendly;
    double sellingPrice = 0.0;  // 0 = unset

    std::optional<double> latitude;
    std::optional<double> longitude;
    bool malformedCoordinates = false;

    std::string locationVillage;
    std::string locationRoad;

    double lifestyleScore = 0.0;

    const RawValue* poiValue(const std::string& key) const;
    std::string poiName(const std::string& key, const std::string& fallback) const;

    // Both coordinates present and within valid ranges
    std::optional<geo::Coordinates> coordinates() const;

    bool hasLocality() const { return !locationVillage.empty() || !locationRoad.empty(); }

    // Parses a flat store record. POI distances are read for every catalog key.
    // Never throws: malformed values degrade to absent or Text.
    static CandidateAttributes fromJson(const nlohmann::json& json, const config::PoiCatalog& catalog);
};

} // namespace models
} // namespace listing_ranker
