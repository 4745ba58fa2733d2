#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace listing_ranker {
namespace models {

// What is known vs. unknown about one candidate for one set of POI keys.
// availablePoiKeys and missingPoiKeys partition the checked keys.
struct DataQualityReport {
    std::string assetId;

    std::set<std::string> availablePoiKeys;
    std::set<std::string> missingPoiKeys;

    bool hasValidPrice = false;
    bool hasValidAssetType = false;
    bool hasValidLocation = false;

    double qualityScore = 0.0;  // [0, 1]

    std::vector<std::string> warnings;

    bool isPoiAvailable(const std::string& key) const { return availablePoiKeys.count(key) > 0; }
    bool isPoiMissing(const std::string& key) const { return missingPoiKeys.count(key) > 0; }

    std::vector<std::string> missingMustHaves(const std::vector<std::string>& mustHave) const;

    nlohmann::json toJson() const;
};

} // namespace models
} // namespace listing_ranker
