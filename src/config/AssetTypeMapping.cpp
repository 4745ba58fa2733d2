#include "../../include/listing_ranker/config/AssetTypeMapping.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace listing_ranker {
namespace config {

namespace {

std::set<int> parseIdSet(const nlohmann::json& value, const std::string& field) {
    if (!value.is_array()) {
        throw std::runtime_error(field + " must be an array of integers");
    }
    std::set<int> ids;
    for (const auto& id : value) {
        if (!id.is_number_integer()) {
            throw std::runtime_error(field + " must be an array of integers");
        }
        ids.insert(id.get<int>());
    }
    return ids;
}

} // namespace

std::string AssetTypeMapping::normalizeLabel(const std::string& label) {
    std::string normalized = label;
    normalized.erase(0, normalized.find_first_not_of(" \t\n\r"));
    normalized.erase(normalized.find_last_not_of(" \t\n\r") + 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

AssetTypeMapping AssetTypeMapping::createDefault() {
    AssetTypeMapping mapping;

    // English labels with the Thai labels the query parser emits.
    // Residential. "condo" still spans both legacy condominium codes.
    mapping.addLabel("condo", {3, 12});
    mapping.addLabel("คอนโด", {3, 12});
    mapping.addLabel("condominium", {3, 12});
    mapping.addLabel("residential_unit", {3, 11, 16});
    mapping.addLabel("ห้องชุด", {3, 11, 16});
    mapping.addLabel("house", {4, 15});
    mapping.addLabel("บ้าน", {4, 15});
    mapping.addLabel("detached_house", {4});
    mapping.addLabel("บ้านเดี่ยว", {4});
    mapping.addLabel("semi_detached_house", {15});
    mapping.addLabel("บ้านแฝด", {15});
    mapping.addLabel("townhome", {1});
    mapping.addLabel("ทาวน์โฮม", {1});
    mapping.addLabel("townhouse", {1});
    mapping.addLabel("ทาวน์เฮ้าส์", {1});
    mapping.addLabel("apartment", {17, 30});
    mapping.addLabel("อพาร์ทเมนท์", {17, 30});
    mapping.addLabel("dormitory", {30});
    mapping.addLabel("หอพัก", {30});

    // Commercial
    mapping.addLabel("commercial_building", {5});
    mapping.addLabel("อาคารพาณิชย์", {5});
    mapping.addLabel("shophouse", {5, 30});
    mapping.addLabel("ตึกแถว", {5, 30});
    mapping.addLabel("home_office", {9});
    mapping.addLabel("โฮมออฟฟิศ", {9});
    mapping.addLabel("office_building", {11, 13});
    mapping.addLabel("สำนักงาน", {11, 13});
    mapping.addLabel("office", {9, 11, 13});
    mapping.addLabel("ออฟฟิศ", {9, 11, 13});
    mapping.addLabel("showroom", {8});
    mapping.addLabel("โชว์รูม", {8});
    mapping.addLabel("department_store", {22});
    mapping.addLabel("ห้าง", {22});
    mapping.addLabel("restaurant", {35});
    mapping.addLabel("ร้านอาหาร", {35});
    mapping.addLabel("market", {25});
    mapping.addLabel("ตลาด", {25});
    mapping.addLabel("gas_station", {14});
    mapping.addLabel("ปั๊มน้ำมัน", {14});

    // Industrial and land
    mapping.addLabel("land", {2});
    mapping.addLabel("ที่ดิน", {2});
    mapping.addLabel("vacant_land", {2});
    mapping.addLabel("ที่ดินเปล่า", {2});
    mapping.addLabel("factory", {6, 36});
    mapping.addLabel("โรงงาน", {6, 36});
    mapping.addLabel("warehouse", {6, 34});
    mapping.addLabel("โกดัง", {6, 34});
    mapping.addLabel("คลังสินค้า", {6, 34});

    // Hospitality and institutions
    mapping.addLabel("hotel", {10});
    mapping.addLabel("โรงแรม", {10});
    mapping.addLabel("resort", {10});
    mapping.addLabel("รีสอร์ท", {10});
    mapping.addLabel("school", {29});
    mapping.addLabel("โรงเรียน", {29});
    mapping.addLabel("hospital", {18, 19});
    mapping.addLabel("โรงพยาบาล", {18, 19});
    mapping.addLabel("golf_course", {21});
    mapping.addLabel("สนามกอล์ฟ", {21});

    mapping.setCondoIds({3, 12});
    mapping.setLowRiseIds({4, 15, 1});
    return mapping;
}

AssetTypeMapping AssetTypeMapping::withOverrides(const nlohmann::json& overrides) const {
    if (!overrides.is_object()) {
        throw std::runtime_error("asset_types must be a JSON object");
    }

    AssetTypeMapping merged = *this;
    if (overrides.contains("labels")) {
        const auto& labels = overrides["labels"];
        if (!labels.is_object()) {
            throw std::runtime_error("asset_types.labels must be an object of label -> id array");
        }
        for (const auto& [label, ids] : labels.items()) {
            std::set<int> parsed = parseIdSet(ids, "asset_types.labels." + label);
            merged.addLabel(label, std::vector<int>(parsed.begin(), parsed.end()));
        }
    }
    if (overrides.contains("condo_ids")) {
        merged.setCondoIds(parseIdSet(overrides["condo_ids"], "asset_types.condo_ids"));
    }
    if (overrides.contains("low_rise_ids")) {
        merged.setLowRiseIds(parseIdSet(overrides["low_rise_ids"], "asset_types.low_rise_ids"));
    }
    return merged;
}

void AssetTypeMapping::addLabel(const std::string& label, std::vector<int> ids) {
    labels_[normalizeLabel(label)] = std::move(ids);
}

std::set<int> AssetTypeMapping::acceptedIds(const std::vector<std::string>& labels) const {
    std::set<int> accepted;
    for (const auto& label : labels) {
        auto it = labels_.find(normalizeLabel(label));
        if (it != labels_.end()) {
            accepted.insert(it->second.begin(), it->second.end());
        }
    }
    return accepted;
}

bool AssetTypeMapping::hasLabel(const std::string& label) const {
    return labels_.count(normalizeLabel(label)) > 0;
}

nlohmann::json AssetTypeMapping::toJson() const {
    nlohmann::json labels = nlohmann::json::object();
    for (const auto& [label, ids] : labels_) {
        labels[label] = ids;
    }
    return {
        {"labels", labels},
        {"condo_ids", condoIds_},
        {"low_rise_ids", lowRiseIds_}
    };
}

} // namespace config
} // namespace listing_ranker
