#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace listing_ranker {
namespace config {

// Maps requested asset-type labels to store asset-type ids (many-to-many),
// and groups ids into the classes the pet-friendliness inference uses.
class AssetTypeMapping {
public:
    AssetTypeMapping() = default;

    static AssetTypeMapping createDefault();

    // Labels in `overrides.labels` replace or add entries; id classes are
    // replaced when present. Throws std::runtime_error on malformed input.
    AssetTypeMapping withOverrides(const nlohmann::json& overrides) const;

    void addLabel(const std::string& label, std::vector<int> ids);
    void setCondoIds(std::set<int> ids) { condoIds_ = std::move(ids); }
    void setLowRiseIds(std::set<int> ids) { lowRiseIds_ = std::move(ids); }

    // Union of ids accepted for the given labels; unknown labels contribute nothing
    std::set<int> acceptedIds(const std::vector<std::string>& labels) const;

    bool hasLabel(const std::string& label) const;

    // Condominium-class ids, typically no pets unless stated otherwise
    bool isCondoClass(int assetTypeId) const { return condoIds_.count(assetTypeId) > 0; }
    // Detached, semi-detached and townhome ids, typically pets allowed
    bool isLowRiseClass(int assetTypeId) const { return lowRiseIds_.count(assetTypeId) > 0; }

    const std::map<std::string, std::vector<int>>& labels() const { return labels_; }

    nlohmann::json toJson() const;

    // Lower-case and trim, so "Condo " and "condo" resolve the same
    static std::string normalizeLabel(const std::string& label);

private:
    std::map<std::string, std::vector<int>> labels_;
    std::set<int> condoIds_;
    std::set<int> lowRiseIds_;
};

} // namespace config
} // namespace listing_ranker
