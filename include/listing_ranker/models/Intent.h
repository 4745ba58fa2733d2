#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace listing_ranker {
namespace models {

// Inclusive price bounds; either side may be unset
struct PriceRange {
    std::optional<double> min;
    std::optional<double> max;

    bool isSet() const { return min.has_value() || max.has_value(); }
    bool isBelow(double price) const { return min.has_value() && price < *min; }
    bool isAbove(double price) const { return max.has_value() && price > *max; }
    bool contains(double price) const { return !isBelow(price) && !isAbove(price); }
};

// Structured preferences extracted from a free-form query by an external parser.
// POI keys outside the catalog are kept here and ignored by the scorer.
struct Intent {
    std::vector<std::string> assetTypes;   // empty = any type
    std::vector<std::string> mustHave;
    std::vector<std::string> niceToHave;
    std::vector<std::string> avoidPoi;
    std::optional<bool> petFriendly;       // unset = no preference
    PriceRange priceRange;

    // Free-text places, resolved to coordinates by an external geocoder
    std::string targetLocation;
    std::string avoidLocation;

    bool requiresPoi(const std::string& key) const;

    // Lenient: wrong-typed fields fall back to "unspecified", duplicates are dropped
    static Intent fromJson(const nlohmann::json& json);
    nlohmann::json toJson() const;
};

} // namespace models
} // namespace listing_ranker
