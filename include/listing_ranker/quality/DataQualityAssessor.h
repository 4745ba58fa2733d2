#pragma once

#include "../config/ScoringConfig.h"
#include "../models/CandidateAttributes.h"
#include "../models/DataQualityReport.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace listing_ranker {
namespace quality {

// What is known about a single attribute value
enum class DataState {
    Verified,   // present, numeric, non-negative and not a sentinel
    Missing,    // absent, null or a sentinel / near-sentinel number
    Unusable    // present but not a usable distance (text, negative)
};

std::string dataStateToString(DataState state);

/**
 * Separates "we know it is far" from "we do not know".
 *
 * Legacy stores encode missing distances as 99999; every gate must read
 * distances through verifiedDistance() so such values are never mistaken
 * for real measurements.
 */
class DataQualityAssessor {
public:
    explicit DataQualityAssessor(std::shared_ptr<const config::ScoringConfig> config);

    bool isMissingValue(const models::RawValue* value) const;

    // Positive and not an exact sentinel; prices are never near-sentinel filtered
    bool hasValidPrice(const models::CandidateAttributes& attributes) const;

    DataState classify(const models::CandidateAttributes& attributes, const std::string& key) const;

    // Distance only when the value is Verified
    std::optional<double> verifiedDistance(const models::CandidateAttributes& attributes,
                                           const std::string& key) const;

    // Keys outside the POI catalog are not applicable and are not checked
    models::DataQualityReport assess(const models::CandidateAttributes& attributes,
                                     const std::vector<std::string>& requiredKeys,
                                     const std::vector<std::string>& optionalKeys = {}) const;

    // Reports keyed by asset id; a later candidate with a duplicate id replaces the earlier one
    std::map<std::string, models::DataQualityReport> batchAssess(
        const std::vector<models::CandidateAttributes>& candidates,
        const std::vector<std::string>& requiredKeys,
        const std::vector<std::string>& optionalKeys = {}) const;

private:
    std::shared_ptr<const config::ScoringConfig> config_;

    bool isSentinel(double value) const;
};

} // namespace quality
} // namespace listing_ranker
