#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace listing_ranker {
namespace config {

// Shape of the distance -> closeness mapping for a POI
enum class CurveType {
    LINEAR,
    EXPONENTIAL
};

std::optional<CurveType> parseCurveType(const std::string& name);
std::string curveTypeToString(CurveType curve);

struct PoiDefinition {
    std::string key;
    double radius = 3000.0;   // meters
    double weight = 0.0;
    CurveType curve = CurveType::LINEAR;
    std::string category;
    std::string displayName;
    bool isRapidTransit = false;  // subway / elevated rail only, never legacy rail
};

// Immutable lookup table of POI definitions, in declaration order.
class PoiCatalog {
public:
    PoiCatalog() = default;
    explicit PoiCatalog(std::vector<PoiDefinition> definitions);

    static PoiCatalog createDefault();

    // Returns a copy with entries from `overrides` merged field by field.
    // Unknown keys are added. Throws std::runtime_error on invalid values.
    PoiCatalog withOverrides(const nlohmann::json& overrides) const;

    const PoiDefinition* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    // Falls back to the key itself for keys outside the catalog
    std::string displayName(const std::string& key) const;

    bool isRapidTransit(const std::string& key) const;
    std::vector<std::string> rapidTransitKeys() const;

    const std::vector<PoiDefinition>& definitions() const { return definitions_; }
    size_t size() const { return definitions_.size(); }

    nlohmann::json toJson() const;

private:
    std::vector<PoiDefinition> definitions_;
    std::unordered_map<std::string, size_t> index_;

    void rebuildIndex();
};

} // namespace config
} // namespace listing_ranker
