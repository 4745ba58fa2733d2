#include "../../include/listing_ranker/ranking/RankingPipeline.h"
#include "../../include/listing_ranker/ranking/WorkerGroup.h"
#include "../../include/listing_ranker/common/Logger.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace listing_ranker {
namespace ranking {

namespace {

// Per-candidate slot written by exactly one worker
struct ScoredSlot {
    models::ScoringResult scoring;
    double finalScore = 0.0;
};

std::vector<std::string> mergeKeys(const std::vector<std::string>& first, const std::vector<std::string>& second) {
    std::vector<std::string> merged = first;
    for (const auto& key : second) {
        if (std::find(merged.begin(), merged.end(), key) == merged.end()) {
            merged.push_back(key);
        }
    }
    return merged;
}

} // namespace

nlohmann::json RankedResult::toJson() const {
    nlohmann::json signals = nlohmann::json::array();
    for (const auto& signal : scoring.positiveSignals) signals.push_back(models::renderSignal(signal));
    for (const auto& signal : scoring.negativeSignals) signals.push_back(models::renderSignal(signal));

    return {
        {"id", attributes.id},
        {"asset_type", attributes.assetTypeName},
        {"final_score", finalScore},
        {"structured_score", scoring.score},
        {"semantic_score", semanticScore},
        {"lifestyle_score", attributes.lifestyleScore},
        {"signals", signals},
        {"scoring", scoring.toJson()}
    };
}

nlohmann::json RankingOutcome::toJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& result : results) {
        items.push_back(result.toJson());
    }
    nlohmann::json j = {
        {"results", items},
        {"pool_size", poolSize},
        {"disqualified", disqualified},
        {"filtered_by_quality", filteredByQuality}
    };
    if (!message.empty()) {
        j["message"] = message;
    }
    return j;
}

RankingPipeline::RankingPipeline(std::shared_ptr<const config::ScoringConfig> config)
    : config_(config ? std::move(config)
                     : std::make_shared<const config::ScoringConfig>(config::ScoringConfig::createDefault())),
      scorer_(config_) {
}

double RankingPipeline::combineScores(double structuredScore, double semanticScore, double lifestyleScore) const {
    const auto& ranking = config_->ranking;
    return ranking.structuredWeight * structuredScore +
           ranking.semanticWeight * semanticScore +
           ranking.lifestyleWeight * lifestyleScore;
}

size_t RankingPipeline::workerCount(size_t taskCount) const {
    size_t workers = config_->ranking.workerThreads;
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, taskCount));
}

RankingOutcome RankingPipeline::rank(const std::vector<RankingCandidate>& candidates,
                                     const models::Intent& intent,
                                     const std::optional<geo::Coordinates>& targetCoords,
                                     const std::optional<geo::Coordinates>& avoidCoords) const {
    auto start = std::chrono::steady_clock::now();
    const auto& ranking = config_->ranking;

    RankingOutcome outcome;
    size_t poolSize = candidates.size();
    if (ranking.topKCandidates > 0 && poolSize > ranking.topKCandidates) {
        LOG_DEBUG("Retrieved pool truncated from " + std::to_string(poolSize) + " to " +
                  std::to_string(ranking.topKCandidates) + " candidates");
        poolSize = ranking.topKCandidates;
    }
    outcome.poolSize = poolSize;

    const std::vector<std::string>& required = intent.mustHave;
    const std::vector<std::string> optional = mergeKeys(intent.niceToHave, intent.avoidPoi);

    std::vector<ScoredSlot> slots(poolSize);
    auto scoreRange = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            const auto& candidate = candidates[i];
            auto quality = scorer_.assessor().assess(candidate.attributes, required, optional);
            slots[i].scoring = scorer_.score(candidate.attributes, intent, quality, targetCoords, avoidCoords);
            slots[i].finalScore = combineScores(slots[i].scoring.score, candidate.semanticScore,
                                                candidate.attributes.lifestyleScore);
        }
    };

    size_t workers = workerCount(poolSize);
    if (workers <= 1) {
        scoreRange(0, poolSize);
    } else {
        size_t chunk = (poolSize + workers - 1) / workers;
        WorkerGroup group;
        group.reserve(workers);
        for (size_t begin = 0; begin < poolSize; begin += chunk) {
            group.spawn(scoreRange, begin, std::min(begin + chunk, poolSize));
        }
        group.joinAll();
    }

    double minQuality = config_->dataQuality.minQualityForInclusion;
    std::vector<RankedResult> survivors;
    for (size_t i = 0; i < poolSize; ++i) {
        auto& slot = slots[i];
        if (slot.scoring.isDisqualified) {
            ++outcome.disqualified;
            continue;
        }
        if (slot.scoring.dataQuality && slot.scoring.dataQuality->qualityScore < minQuality) {
            ++outcome.filteredByQuality;
            continue;
        }
        RankedResult ranked;
        ranked.attributes = candidates[i].attributes;
        ranked.semanticScore = candidates[i].semanticScore;
        ranked.finalScore = slot.finalScore;
        ranked.inputIndex = i;
        ranked.scoring = std::move(slot.scoring);
        survivors.push_back(std::move(ranked));
    }

    std::stable_sort(survivors.begin(), survivors.end(), [](const RankedResult& a, const RankedResult& b) {
        return a.finalScore > b.finalScore;
    });
    if (survivors.size() > ranking.finalTopN) {
        survivors.resize(ranking.finalTopN);
    }

    if (survivors.empty()) {
        outcome.message = "No listings satisfy the requested constraints";
    } else if (survivors.front().finalScore < ranking.minTopScore) {
        outcome.message = "Best match scored " + std::to_string(survivors.front().finalScore) +
                          ", below the minimum of " + std::to_string(ranking.minTopScore) +
                          "; no sufficiently relevant listings found";
        survivors.clear();
    }
    outcome.results = std::move(survivors);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    LOG_INFO_STREAM("Ranked " << poolSize << " candidates on " << workers << " worker(s) in "
                    << elapsed.count() << " ms: " << outcome.disqualified << " disqualified, "
                    << outcome.filteredByQuality << " below quality threshold, "
                    << outcome.results.size() << " returned");
    return outcome;
}

std::optional<RankingCandidate> RankingPipeline::parseCandidate(const nlohmann::json& json,
                                                                const config::PoiCatalog& catalog) {
    if (!json.is_object()) {
        return std::nullopt;
    }

    RankingCandidate candidate;
    if (json.contains("metadata") && json["metadata"].is_object()) {
        candidate.attributes = models::CandidateAttributes::fromJson(json["metadata"], catalog);
        if (candidate.attributes.id.empty() && json.contains("id")) {
            const auto& id = json["id"];
            candidate.attributes.id = id.is_string() ? id.get<std::string>() : id.dump();
        }
    } else {
        candidate.attributes = models::CandidateAttributes::fromJson(json, catalog);
    }

    if (json.contains("semantic_score") && json["semantic_score"].is_number()) {
        candidate.semanticScore = std::clamp(json["semantic_score"].get<double>(), 0.0, 1.0);
    }
    return candidate;
}

std::vector<RankingCandidate> RankingPipeline::parseCandidates(const nlohmann::json& json,
                                                               const config::PoiCatalog& catalog) {
    std::vector<RankingCandidate> candidates;
    if (!json.is_array()) {
        LOG_WARNING("Candidate list must be a JSON array");
        return candidates;
    }
    candidates.reserve(json.size());
    for (size_t i = 0; i < json.size(); ++i) {
        auto candidate = parseCandidate(json[i], catalog);
        if (!candidate) {
            LOG_WARNING("Skipping candidate #" + std::to_string(i) + ": not a JSON object");
            continue;
        }
        candidates.push_back(std::move(*candidate));
    }
    return candidates;
}

} // namespace ranking
} // namespace listing_ranker
