#include "../../include/listing_ranker/quality/DataQualityAssessor.h"
#include "../../include/listing_ranker/common/Logger.h"
#include <algorithm>
#include <set>

namespace listing_ranker {
namespace quality {

namespace {
constexpr double kPoiCompletenessWeight = 0.4;
constexpr double kPriceWeight = 0.3;
constexpr double kAssetTypeWeight = 0.2;
constexpr double kLocationWeight = 0.1;
}

std::string dataStateToString(DataState state) {
    switch (state) {
        case DataState::Verified: return "verified";
        case DataState::Missing: return "missing";
        case DataState::Unusable: return "unusable";
    }
    return "unknown";
}

DataQualityAssessor::DataQualityAssessor(std::shared_ptr<const config::ScoringConfig> config)
    : config_(config ? std::move(config)
                     : std::make_shared<const config::ScoringConfig>(config::ScoringConfig::createDefault())) {
}

bool DataQualityAssessor::isSentinel(double value) const {
    const auto& sentinels = config_->dataQuality.missingDataSentinels;
    if (std::find(sentinels.begin(), sentinels.end(), value) != sentinels.end()) {
        return true;
    }
    return value >= config_->dataQuality.nearSentinelThreshold;
}

bool DataQualityAssessor::isMissingValue(const models::RawValue* value) const {
    if (value == nullptr || value->kind == models::RawValue::Kind::Null) {
        return true;
    }
    return value->isNumber() && isSentinel(value->number);
}

DataState DataQualityAssessor::classify(const models::CandidateAttributes& attributes,
                                        const std::string& key) const {
    const models::RawValue* value = attributes.poiValue(key);
    if (isMissingValue(value)) {
        return DataState::Missing;
    }
    if (!value->isNumber() || value->number < 0) {
        return DataState::Unusable;
    }
    return DataState::Verified;
}

std::optional<double> DataQualityAssessor::verifiedDistance(const models::CandidateAttributes& attributes,
                                                            const std::string& key) const {
    if (classify(attributes, key) != DataState::Verified) {
        return std::nullopt;
    }
    return attributes.poiValue(key)->number;
}

bool DataQualityAssessor::hasValidPrice(const models::CandidateAttributes& attributes) const {
    if (attributes.sellingPrice <= 0) {
        return false;
    }
    const auto& sentinels = config_->dataQuality.missingDataSentinels;
    return std::find(sentinels.begin(), sentinels.end(), attributes.sellingPrice) == sentinels.end();
}

models::DataQualityReport DataQualityAssessor::assess(const models::CandidateAttributes& attributes,
                                                      const std::vector<std::string>& requiredKeys,
                                                      const std::vector<std::string>& optionalKeys) const {
    models::DataQualityReport report;
    report.assetId = attributes.id.empty() ? "unknown" : attributes.id;

    const auto& catalog = config_->poiCatalog;
    std::set<std::string> required;
    for (const auto& key : requiredKeys) {
        if (catalog.contains(key)) required.insert(key);
    }

    // Required keys first so warnings follow the caller's order
    std::vector<std::string> checked;
    std::set<std::string> seen;
    for (const auto* keys : {&requiredKeys, &optionalKeys}) {
        for (const auto& key : *keys) {
            if (catalog.contains(key) && seen.insert(key).second) {
                checked.push_back(key);
            }
        }
    }

    for (const auto& key : checked) {
        DataState state = classify(attributes, key);
        if (state == DataState::Verified) {
            report.availablePoiKeys.insert(key);
            continue;
        }
        report.missingPoiKeys.insert(key);
        LOG_TRACE_STREAM(report.assetId << ": " << key << " is " << dataStateToString(state));
        if (required.count(key) > 0) {
            if (state == DataState::Unusable) {
                report.warnings.push_back("Unusable data for " + catalog.displayName(key) + " (cannot verify)");
            } else {
                report.warnings.push_back("No data for " + catalog.displayName(key) + " (cannot verify)");
            }
        }
    }

    report.hasValidPrice = hasValidPrice(attributes);
    report.hasValidAssetType = attributes.assetTypeId.has_value();
    report.hasValidLocation = attributes.hasLocality() || attributes.coordinates().has_value();

    double poiCompleteness = checked.empty()
        ? 1.0
        : static_cast<double>(report.availablePoiKeys.size()) / static_cast<double>(checked.size());

    report.qualityScore = kPoiCompletenessWeight * poiCompleteness +
                          (report.hasValidPrice ? kPriceWeight : 0.0) +
                          (report.hasValidAssetType ? kAssetTypeWeight : 0.0) +
                          (report.hasValidLocation ? kLocationWeight : 0.0);
    report.qualityScore = std::clamp(report.qualityScore, 0.0, 1.0);

    LOG_TRACE_STREAM("Quality for " << report.assetId << ": " << report.qualityScore
                     << " (" << report.availablePoiKeys.size() << "/" << checked.size() << " POIs verified)");
    return report;
}

std::map<std::string, models::DataQualityReport> DataQualityAssessor::batchAssess(
    const std::vector<models::CandidateAttributes>& candidates,
    const std::vector<std::string>& requiredKeys,
    const std::vector<std::string>& optionalKeys) const {
    std::map<std::string, models::DataQualityReport> reports;
    for (const auto& candidate : candidates) {
        auto report = assess(candidate, requiredKeys, optionalKeys);
        std::string id = report.assetId;
        reports.insert_or_assign(std::move(id), std::move(report));
    }
    return reports;
}

} // namespace quality
} // namespace listing_ranker
