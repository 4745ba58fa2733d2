#include "../../include/listing_ranker/scoring/StructuredScorer.h"
#include "../../include/listing_ranker/scoring/ProximityCurve.h"
#include "../../include/listing_ranker/common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <vector>

namespace listing_ranker {
namespace scoring {

namespace {

// 5000000 -> "5,000,000". Works on the printed digits so any finite amount formats.
std::string formatAmount(double amount) {
    std::ostringstream printed;
    printed << std::fixed << std::setprecision(0) << amount;
    std::string digits = printed.str();

    std::string sign;
    if (!digits.empty() && digits.front() == '-') {
        sign = "-";
        digits.erase(0, 1);
    }
    if (digits.size() <= 3 || !std::all_of(digits.begin(), digits.end(),
                                            [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return sign + digits;
    }

    std::string out;
    size_t lead = digits.size() % 3 == 0 ? 3 : digits.size() % 3;
    out.append(digits, 0, lead);
    for (size_t i = lead; i < digits.size(); i += 3) {
        out.push_back(',');
        out.append(digits, i, 3);
    }
    return sign + out;
}

std::string joinLabels(const std::vector<std::string>& labels) {
    std::string joined;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += labels[i];
    }
    return joined;
}

std::string describeAssetType(const models::CandidateAttributes& attributes) {
    if (!attributes.assetTypeName.empty()) {
        return attributes.assetTypeName;
    }
    if (attributes.assetTypeId) {
        return "type id " + std::to_string(*attributes.assetTypeId);
    }
    return "unknown type";
}

std::string describeDistance(const std::optional<double>& distance) {
    return distance ? geo::formatDistance(*distance) : "no data";
}

} // namespace

StructuredScorer::StructuredScorer(std::shared_ptr<const config::ScoringConfig> config)
    : config_(config ? std::move(config)
                     : std::make_shared<const config::ScoringConfig>(config::ScoringConfig::createDefault())),
      assessor_(config_) {
}

models::ScoringResult StructuredScorer::score(const models::CandidateAttributes& attributes,
                                              const models::Intent& intent,
                                              const models::DataQualityReport& quality,
                                              const std::optional<geo::Coordinates>& targetCoords,
                                              const std::optional<geo::Coordinates>& avoidCoords) const {
    models::ScoringResult result;
    result.dataQuality = quality;

    // Order matters: later checks assume the earlier gates passed
    if (!checkAssetType(attributes, intent, result)) return result;
    if (!checkTransportType(attributes, intent, result)) return result;
    scoreRapidTransit(attributes, intent, result);
    if (!checkMustHavePois(attributes, intent, result)) return result;
    scorePetFriendly(attributes, intent, result);
    scoreNiceToHave(attributes, intent, result);
    if (!checkAvoidPois(attributes, intent, result)) return result;
    scorePriceRange(attributes, intent, result);

    if (targetCoords && !scoreTargetLocation(attributes, *targetCoords, result)) {
        return result;
    }
    if (avoidCoords) {
        scoreAvoidLocation(attributes, *avoidCoords, result);
    }

    LOG_TRACE_STREAM("Scored " << attributes.id << ": " << result.score
                     << " (+" << result.positiveSignals.size()
                     << " / -" << result.negativeSignals.size() << " signals)");
    return result;
}

// ===== Gates =====

bool StructuredScorer::checkAssetType(const models::CandidateAttributes& attributes,
                                      const models::Intent& intent,
                                      models::ScoringResult& result) const {
    if (intent.assetTypes.empty()) {
        return true;
    }

    // Unmapped labels contribute no ids; with none mapped nothing can match
    const auto& mapping = config_->assetTypes;
    std::set<int> accepted = mapping.acceptedIds(intent.assetTypes);
    if (accepted.empty()) {
        LOG_DEBUG("No requested asset type label is mapped (" + joinLabels(intent.assetTypes) + ")");
    }
    std::string actual = describeAssetType(attributes);

    if (attributes.assetTypeId && accepted.count(*attributes.assetTypeId) > 0) {
        result.addPositive("asset_type", "Matches requested type (" + actual + ")",
                           config_->weights.assetTypeMatch);
        return true;
    }

    std::string detail = "wanted " + joinLabels(intent.assetTypes) + " but found " + actual;
    if (config_->hardConstraints.wrongAssetType) {
        disqualify(attributes, "Asset type mismatch: " + detail, result);
        return false;
    }
    result.addNegative("asset_type", "Asset type mismatch (" + detail + ")",
                       config_->weights.assetTypeMismatch);
    return true;
}

bool StructuredScorer::checkTransportType(const models::CandidateAttributes& attributes,
                                          const models::Intent& intent,
                                          models::ScoringResult& result) const {
    const auto& catalog = config_->poiCatalog;
    bool wantsRapidTransit = std::any_of(intent.mustHave.begin(), intent.mustHave.end(),
                                         [&catalog](const std::string& key) { return catalog.isRapidTransit(key); });
    if (!wantsRapidTransit) {
        return true;
    }

    bool hasRapidTransit = false;
    std::vector<std::string> rapidDetails;
    for (const auto& key : catalog.rapidTransitKeys()) {
        const config::PoiDefinition* poi = catalog.find(key);
        auto distance = assessor_.verifiedDistance(attributes, key);
        if (distance && *distance < poi->radius) {
            hasRapidTransit = true;
        }
        rapidDetails.push_back(poi->displayName + ": " + describeDistance(distance));
    }

    const auto& proximity = config_->proximity;
    auto railDistance = assessor_.verifiedDistance(attributes, proximity.legacyRailKey);
    bool hasLegacyRail = railDistance && *railDistance < proximity.legacyRailThreshold;

    if (hasRapidTransit || !hasLegacyRail) {
        return true;
    }

    std::string detail = "(" + joinLabels(rapidDetails) + ", " +
                         catalog.displayName(proximity.legacyRailKey) + ": " +
                         geo::formatDistance(*railDistance) + ")";
    if (config_->hardConstraints.wrongTransportType) {
        disqualify(attributes, "Wants rapid transit but only legacy rail is nearby " + detail, result);
        return false;
    }
    result.addNegative("transport_type", "Wants rapid transit but only legacy rail is nearby " + detail,
                       config_->weights.wrongTransportType);
    return true;
}

void StructuredScorer::scoreRapidTransit(const models::CandidateAttributes& attributes,
                                         const models::Intent& intent,
                                         models::ScoringResult& result) const {
    const auto& catalog = config_->poiCatalog;
    for (const auto& key : intent.mustHave) {
        if (!catalog.isRapidTransit(key)) {
            continue;
        }
        const config::PoiDefinition* poi = catalog.find(key);
        std::string label = "rapid_transit:" + key;

        auto distance = assessor_.verifiedDistance(attributes, key);
        if (!distance) {
            warnUnverified(attributes, key, label, result);
            continue;
        }

        std::string name = attributes.poiName(key, poi->displayName);
        if (*distance <= poi->radius) {
            result.addPositive(label,
                               "Near " + poi->displayName + " '" + name + "' (" + geo::formatDistance(*distance) + ")",
                               proximityContribution(*poi, *distance));
        } else {
            result.addNegative(label,
                               poi->displayName + " '" + name + "' is " + geo::formatDistance(*distance) +
                               " away (beyond " + geo::formatDistance(poi->radius) + ")");
        }
    }
}

bool StructuredScorer::checkMustHavePois(const models::CandidateAttributes& attributes,
                                         const models::Intent& intent,
                                         models::ScoringResult& result) const {
    const auto& catalog = config_->poiCatalog;
    for (const auto& key : intent.mustHave) {
        const config::PoiDefinition* poi = catalog.find(key);
        if (poi == nullptr || poi->isRapidTransit) {
            continue;
        }
        std::string label = "must_have:" + key;

        auto distance = assessor_.verifiedDistance(attributes, key);
        if (!distance) {
            // Absence cannot be asserted from missing data
            warnUnverified(attributes, key, label, result);
            continue;
        }

        if (*distance <= poi->radius) {
            std::string name = attributes.poiName(key, poi->displayName);
            result.addPositive(label,
                               "Near " + poi->displayName + " '" + name + "' (" + geo::formatDistance(*distance) + ")",
                               proximityContribution(*poi, *distance));
            continue;
        }

        std::string detail = poi->displayName + " is " + geo::formatDistance(*distance) +
                             " away (radius " + geo::formatDistance(poi->radius) + ")";
        if (config_->hardConstraints.mustHavePoiTooFar) {
            disqualify(attributes, "Required " + detail, result);
            return false;
        }
        result.addNegative(label, "Required " + detail, config_->weights.mustHavePoiTooFar);
    }
    return true;
}

void StructuredScorer::scorePetFriendly(const models::CandidateAttributes& attributes,
                                        const models::Intent& intent,
                                        models::ScoringResult& result) const {
    if (!intent.petFriendly) {
        return;
    }
    const auto& weights = config_->weights;

    if (!*intent.petFriendly) {
        if (attributes.petFriendly && *attributes.petFriendly) {
            result.addNegative("pet_friendly", "Pet friendly building (possible noise)",
                               weights.petDisturbancePenalty);
        }
        return;
    }

    if (attributes.petFriendly) {
        if (*attributes.petFriendly) {
            result.addPositive("pet_friendly", "Pets allowed (stated)", weights.petFriendlyExplicit);
        } else {
            result.addNegative("pet_friendly", "Pets not allowed (stated)", weights.petNotAllowed);
        }
    } else {
        const auto& mapping = config_->assetTypes;
        if (attributes.assetTypeId && mapping.isCondoClass(*attributes.assetTypeId)) {
            result.addNegative("pet_friendly", "Pets likely not allowed (condominium)", weights.petNotAllowed);
        } else if (attributes.assetTypeId && mapping.isLowRiseClass(*attributes.assetTypeId)) {
            result.addPositive("pet_friendly", "Pets likely allowed (low-rise house)", weights.petFriendlyInferred);
        } else {
            result.addNegative("pet_friendly", "Pet policy not stated (must confirm)", weights.petStatusUnknown);
        }
    }

    const config::PoiDefinition* vet = config_->poiCatalog.find(config_->proximity.veterinaryKey);
    if (vet == nullptr) {
        return;
    }
    auto vetDistance = assessor_.verifiedDistance(attributes, vet->key);
    if (vetDistance && *vetDistance <= vet->radius) {
        result.addPositive("near_vet", "Near " + vet->displayName + " (" + geo::formatDistance(*vetDistance) + ")",
                           weights.nearVetBonus);
    }
}

void StructuredScorer::scoreNiceToHave(const models::CandidateAttributes& attributes,
                                       const models::Intent& intent,
                                       models::ScoringResult& result) const {
    for (const auto& key : intent.niceToHave) {
        const config::PoiDefinition* poi = config_->poiCatalog.find(key);
        if (poi == nullptr) {
            continue;
        }
        auto distance = assessor_.verifiedDistance(attributes, key);
        if (!distance || *distance > poi->radius) {
            continue;
        }
        std::string name = attributes.poiName(key, poi->displayName);
        result.addPositive("nice_to_have:" + key,
                           "Has " + poi->displayName + " '" + name + "' (" + geo::formatDistance(*distance) + ")",
                           config_->weights.niceToHavePoi);
    }
}

bool StructuredScorer::checkAvoidPois(const models::CandidateAttributes& attributes,
                                      const models::Intent& intent,
                                      models::ScoringResult& result) const {
    for (const auto& key : intent.avoidPoi) {
        const config::PoiDefinition* poi = config_->poiCatalog.find(key);
        if (poi == nullptr) {
            continue;
        }
        auto distance = assessor_.verifiedDistance(attributes, key);
        if (!distance) {
            continue;
        }

        std::string label = "avoid_poi:" + key;
        double threshold = poi->radius * config_->proximity.avoidRadiusRatio;
        if (*distance <= threshold) {
            std::string detail = poi->displayName + " is only " + geo::formatDistance(*distance) +
                                 " away (needs at least " + geo::formatDistance(threshold) + ")";
            if (config_->hardConstraints.avoidPoiTooClose) {
                disqualify(attributes, "Too close to avoided " + detail, result);
                return false;
            }
            result.addNegative(label, "Too close to avoided " + detail, config_->weights.avoidPoiFailure);
        } else {
            result.addPositive(label,
                               "Away from " + poi->displayName + " (" + geo::formatDistance(*distance) + ")",
                               config_->weights.avoidPoiSuccess);
        }
    }
    return true;
}

void StructuredScorer::scorePriceRange(const models::CandidateAttributes& attributes,
                                       const models::Intent& intent,
                                       models::ScoringResult& result) const {
    const models::PriceRange& range = intent.priceRange;
    if (!range.isSet()) {
        return;
    }
    if (!assessor_.hasValidPrice(attributes)) {
        result.addWarning("price_range", "No price listed");
        return;
    }

    double price = attributes.sellingPrice;
    const auto& weights = config_->weights;
    if (range.isBelow(price)) {
        result.addNegative("price_range",
                           "Price below range (" + formatAmount(price) + " < " + formatAmount(*range.min) + ")",
                           weights.priceOutOfRange);
    } else if (range.isAbove(price)) {
        result.addNegative("price_range",
                           "Price above range (" + formatAmount(price) + " > " + formatAmount(*range.max) + ")",
                           weights.priceOutOfRange);
    } else {
        result.addPositive("price_range", "Price within range (" + formatAmount(price) + ")",
                           weights.priceInRange);
    }
}

bool StructuredScorer::scoreTargetLocation(const models::CandidateAttributes& attributes,
                                           const geo::Coordinates& target,
                                           models::ScoringResult& result) const {
    auto coords = attributes.coordinates();
    if (!coords) {
        result.addWarning("target_location", attributes.malformedCoordinates
                              ? "Invalid listing coordinates (distance to target unknown)"
                              : "No listing coordinates (distance to target unknown)");
        return true;
    }

    double distance = geo::haversineDistance(*coords, target);
    const auto& tiers = config_->targetLocation;
    const auto& weights = config_->weights;
    std::string shown = geo::formatDistance(distance);

    if (distance <= tiers.radiusVeryClose) {
        result.addPositive("target_location", "Very close to target (" + shown + ")", weights.locationVeryClose);
    } else if (distance <= tiers.radiusClose) {
        result.addPositive("target_location", "Within easy reach of target (" + shown + ")", weights.locationClose);
    } else if (distance > tiers.radiusFarLimit) {
        std::string detail = shown + " from target (limit " + geo::formatDistance(tiers.radiusFarLimit) + ")";
        if (config_->hardConstraints.targetLocationTooFar) {
            disqualify(attributes, "Too far: " + detail, result);
            return false;
        }
        result.addNegative("target_location", "Far from target: " + detail, weights.locationFar);
    } else {
        result.addWarning("target_location", "Moderate distance from target (" + shown + ")");
    }
    return true;
}

void StructuredScorer::scoreAvoidLocation(const models::CandidateAttributes& attributes,
                                          const geo::Coordinates& avoid,
                                          models::ScoringResult& result) const {
    auto coords = attributes.coordinates();
    if (!coords) {
        result.addWarning("avoid_location", attributes.malformedCoordinates
                              ? "Invalid listing coordinates (cannot check avoided area)"
                              : "No listing coordinates (cannot check avoided area)");
        return;
    }

    double distance = geo::haversineDistance(*coords, avoid);
    const auto& tiers = config_->avoidLocation;
    const auto& weights = config_->weights;
    std::string shown = geo::formatDistance(distance);

    if (distance <= tiers.radiusHardHit) {
        result.addNegative("avoid_location", "Very close to avoided area (" + shown + ")",
                           weights.avoidLocationHitHard);
    } else if (distance <= tiers.radiusSoftHit) {
        result.addNegative("avoid_location", "Inside the avoided area's radius (" + shown + ")",
                           weights.avoidLocationHitSoft);
    } else {
        result.addPositive("avoid_location", "Away from avoided area (" + shown + ")",
                           weights.avoidLocationSuccess);
    }
}

// ===== Helpers =====

double StructuredScorer::proximityContribution(const config::PoiDefinition& poi, double distance) const {
    return config_->weights.mustHavePoiBase *
           flooredProximityFactor(distance, poi.radius, poi.curve, config_->proximity.minProximityFactor);
}

void StructuredScorer::warnUnverified(const models::CandidateAttributes& attributes,
                                      const std::string& key,
                                      const std::string& label,
                                      models::ScoringResult& result) const {
    std::string name = config_->poiCatalog.displayName(key);
    if (assessor_.classify(attributes, key) == quality::DataState::Unusable) {
        result.addWarning(label, "Unusable data for " + name + " (cannot verify)");
    } else {
        result.addWarning(label, "No data for " + name + " (cannot verify)");
    }
}

void StructuredScorer::disqualify(const models::CandidateAttributes& attributes,
                                  const std::string& reason,
                                  models::ScoringResult& result) const {
    result.disqualify(reason);
    LOG_DEBUG("Disqualified " + attributes.id + ": " + reason);
}

} // namespace scoring
} // namespace listing_ranker
