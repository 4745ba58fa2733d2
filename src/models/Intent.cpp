#include "../../include/listing_ranker/models/Intent.h"
#include <algorithm>

namespace listing_ranker {
namespace models {

namespace {

std::vector<std::string> readKeyList(const nlohmann::json& json, const char* field) {
    std::vector<std::string> keys;
    if (!json.contains(field) || !json[field].is_array()) {
        return keys;
    }
    for (const auto& value : json[field]) {
        if (!value.is_string()) continue;
        std::string key = value.get<std::string>();
        if (key.empty()) continue;
        if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
            keys.push_back(std::move(key));
        }
    }
    return keys;
}

std::optional<double> readBound(const nlohmann::json& range, const char* field) {
    if (range.contains(field) && range[field].is_number()) {
        return range[field].get<double>();
    }
    return std::nullopt;
}

nlohmann::json optionalToJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

bool Intent::requiresPoi(const std::string& key) const {
    return std::find(mustHave.begin(), mustHave.end(), key) != mustHave.end();
}

Intent Intent::fromJson(const nlohmann::json& json) {
    Intent intent;
    if (!json.is_object()) {
        return intent;
    }

    intent.assetTypes = readKeyList(json, "asset_types");
    intent.mustHave = readKeyList(json, "must_have");
    intent.niceToHave = readKeyList(json, "nice_to_have");
    intent.avoidPoi = readKeyList(json, "avoid_poi");

    if (json.contains("pet_friendly") && json["pet_friendly"].is_boolean()) {
        intent.petFriendly = json["pet_friendly"].get<bool>();
    }

    if (json.contains("price_range") && json["price_range"].is_object()) {
        const auto& range = json["price_range"];
        intent.priceRange.min = readBound(range, "min");
        intent.priceRange.max = readBound(range, "max");
    }

    if (json.contains("target_location") && json["target_location"].is_string()) {
        intent.targetLocation = json["target_location"].get<std::string>();
    }
    if (json.contains("avoid_location") && json["avoid_location"].is_string()) {
        intent.avoidLocation = json["avoid_location"].get<std::string>();
    }

    return intent;
}

nlohmann::json Intent::toJson() const {
    return {
        {"asset_types", assetTypes},
        {"must_have", mustHave},
        {"nice_to_have", niceToHave},
        {"avoid_poi", avoidPoi},
        {"pet_friendly", petFriendly ? nlohmann::json(*petFriendly) : nlohmann::json(nullptr)},
        {"price_range", {{"min", optionalToJson(priceRange.min)}, {"max", optionalToJson(priceRange.max)}}},
        {"target_location", targetLocation},
        {"avoid_location", avoidLocation}
    };
}

} // namespace models
} // namespace listing_ranker
