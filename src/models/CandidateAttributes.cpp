#include "../../include/listing_ranker/models/CandidateAttributes.h"
#include "../../include/listing_ranker/config/PoiCatalog.h"
#include <cmath>

namespace listing_ranker {
namespace models {

namespace {

// Stores frequently stringify numbers; accept "1200" and " 1200.5 " but not "12km"
std::optional<double> parseNumericText(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (text.find_first_not_of(" \t", consumed) != std::string::npos) {
            return std::nullopt;
        }
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> readNumeric(const nlohmann::json& value) {
    if (value.is_number()) {
        double number = value.get<double>();
        if (std::isfinite(number)) {
            return number;
        }
        return std::nullopt;
    }
    if (value.is_string()) {
        return parseNumericText(value.get<std::string>());
    }
    return std::nullopt;
}

RawValue toRawValue(const nlohmann::json& value) {
    if (value.is_null()) {
        return RawValue::null();
    }
    if (auto number = readNumeric(value)) {
        return RawValue::fromNumber(*number);
    }
    if (value.is_string()) {
        return RawValue::fromText(value.get<std::string>());
    }
    return RawValue::fromText(value.dump());
}

std::string readString(const nlohmann::json& json, const char* field) {
    if (json.contains(field) && json[field].is_string()) {
        return json[field].get<std::string>();
    }
    return {};
}

// Prefers `primary`, falling back to `fallback` when the primary is absent or null
const nlohmann::json* firstPresent(const nlohmann::json& json, const char* primary, const char* fallback) {
    if (json.contains(primary) && !json[primary].is_null()) {
        return &json[primary];
    }
    if (json.contains(fallback) && !json[fallback].is_null()) {
        return &json[fallback];
    }
    return nullptr;
}

} // namespace

const RawValue* CandidateAttributes::poiValue(const std::string& key) const {
    auto it = poiValues.find(key);
    if (it == poiValues.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string CandidateAttributes::poiName(const std::string& key, const std::string& fallback) const {
    auto it = poiNames.find(key);
    if (it == poiNames.end() || it->second.empty()) {
        return fallback;
    }
    return it->second;
}

std::optional<geo::Coordinates> CandidateAttributes::coordinates() const {
    if (!latitude || !longitude || malformedCoordinates) {
        return std::nullopt;
    }
    geo::Coordinates coords{*latitude, *longitude};
    if (!geo::isValidCoordinates(coords)) {
        return std::nullopt;
    }
    return coords;
}

CandidateAttributes CandidateAttributes::fromJson(const nlohmann::json& json, const config::PoiCatalog& catalog) {
    CandidateAttributes attrs;
    if (!json.is_object()) {
        return attrs;
    }

    if (const auto* id = firstPresent(json, "id", "asset_id")) {
        attrs.id = id->is_string() ? id->get<std::string>() : id->dump();
    }

    if (json.contains("asset_type_id")) {
        if (auto typeId = readNumeric(json["asset_type_id"])) {
            if (std::floor(*typeId) == *typeId && std::fabs(*typeId) < 1e9) {
                attrs.assetTypeId = static_cast<int>(*typeId);
            }
        }
    }
    attrs.assetTypeName = readString(json, "asset_type_fixed");

    for (const auto& def : catalog.definitions()) {
        if (json.contains(def.key)) {
            attrs.poiValues.emplace(def.key, toRawValue(json[def.key]));
        }
        std::string name = readString(json, (def.key + "_name").c_str());
        if (!name.empty()) {
            attrs.poiNames.emplace(def.key, std::move(name));
        }
    }

    if (json.contains("pet_friendly")) {
        const auto& pet = json["pet_friendly"];
        if (pet.is_boolean()) {
            attrs.petFriendly = pet.get<bool>();
        } else if (pet.is_string()) {
            std::string text = pet.get<std::string>();
            if (text == "true" || text == "True") attrs.petFriendly = true;
            else if (text == "false" || text == "False") attrs.petFriendly = false;
        }
    }

    if (json.contains("asset_details_selling_price")) {
        if (auto price = readNumeric(json["asset_details_selling_price"])) {
            attrs.sellingPrice = *price > 0 ? *price : 0.0;
        }
    }

    const auto* lat = firstPresent(json, "latitude", "location_latitude");
    const auto* lng = firstPresent(json, "longitude", "location_longitude");
    if (lat) {
        attrs.latitude = readNumeric(*lat);
        if (!attrs.latitude) attrs.malformedCoordinates = true;
    }
    if (lng) {
        attrs.longitude = readNumeric(*lng);
        if (!attrs.longitude) attrs.malformedCoordinates = true;
    }
    if (attrs.latitude && attrs.longitude &&
        !geo::isValidCoordinates(geo::Coordinates{*attrs.latitude, *attrs.longitude})) {
        attrs.malformedCoordinates = true;
    }

    attrs.locationVillage = readString(json, "location_village_th");
    attrs.locationRoad = readString(json, "location_road_th");

    if (json.contains("lifestyle_score")) {
        if (auto lifestyle = readNumeric(json["lifestyle_score"])) {
            attrs.lifestyleScore = *lifestyle;
        }
    }

    return attrs;
}

} // namespace models
} // namespace listing_ranker
