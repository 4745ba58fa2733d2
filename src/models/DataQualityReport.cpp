#include "../../include/listing_ranker/models/DataQualityReport.h"
#include <algorithm>
#include <iterator>

namespace listing_ranker {
namespace models {

std::vector<std::string> DataQualityReport::missingMustHaves(const std::vector<std::string>& mustHave) const {
    std::vector<std::string> missing;
    std::copy_if(mustHave.begin(), mustHave.end(), std::back_inserter(missing),
                 [this](const std::string& key) { return isPoiMissing(key); });
    return missing;
}

nlohmann::json DataQualityReport::toJson() const {
    return {
        {"asset_id", assetId},
        {"available_poi_keys", availablePoiKeys},
        {"missing_poi_keys", missingPoiKeys},
        {"has_valid_price", hasValidPrice},
        {"has_valid_asset_type", hasValidAssetType},
        {"has_valid_location", hasValidLocation},
        {"quality_score", qualityScore},
        {"warnings", warnings}
    };
}

} // namespace models
} // namespace listing_ranker
