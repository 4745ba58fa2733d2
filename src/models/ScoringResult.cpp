#include "../../include/listing_ranker/models/ScoringResult.h"

namespace listing_ranker {
namespace models {

// ===== Signals =====

std::string signalKindToString(SignalKind kind) {
    switch (kind) {
        case SignalKind::POSITIVE: return "positive";
        case SignalKind::NEGATIVE: return "negative";
        case SignalKind::WARNING: return "warning";
    }
    return "unknown";
}

std::string renderSignal(const Signal& signal) {
    switch (signal.kind) {
        case SignalKind::POSITIVE: return "[+] " + signal.message;
        case SignalKind::NEGATIVE: return "[-] " + signal.message;
        case SignalKind::WARNING: return "[!] " + signal.message;
    }
    return signal.message;
}

namespace {

nlohmann::json signalToJson(const Signal& signal) {
    return {
        {"kind", signalKindToString(signal.kind)},
        {"label", signal.label},
        {"message", signal.message},
        {"contribution", signal.contribution}
    };
}

} // namespace

// ===== ScoringResult =====

void ScoringResult::applyDelta(const std::string& label, double delta) {
    if (delta == 0.0) {
        return;
    }
    score += delta;
    scoreBreakdown[label] += delta;
}

void ScoringResult::addPositive(const std::string& label, const std::string& message, double delta) {
    positiveSignals.push_back({SignalKind::POSITIVE, label, message, delta});
    applyDelta(label, delta);
}

void ScoringResult::addNegative(const std::string& label, const std::string& message, double delta) {
    negativeSignals.push_back({SignalKind::NEGATIVE, label, message, delta});
    applyDelta(label, delta);
}

void ScoringResult::addWarning(const std::string& label, const std::string& message) {
    negativeSignals.push_back({SignalKind::WARNING, label, message, 0.0});
}

void ScoringResult::disqualify(const std::string& reason) {
    isDisqualified = true;
    disqualificationReason = reason;
    score = 0.0;
    scoreBreakdown.clear();
}

nlohmann::json ScoringResult::toJson() const {
    nlohmann::json positives = nlohmann::json::array();
    for (const auto& s : positiveSignals) positives.push_back(signalToJson(s));
    nlohmann::json negatives = nlohmann::json::array();
    for (const auto& s : negativeSignals) negatives.push_back(signalToJson(s));

    nlohmann::json j = {
        {"score", score},
        {"is_disqualified", isDisqualified},
        {"disqualification_reason", disqualificationReason ? nlohmann::json(*disqualificationReason) : nlohmann::json(nullptr)},
        {"positive_signals", positives},
        {"negative_signals", negatives},
        {"score_breakdown", scoreBreakdown}
    };
    if (dataQuality) {
        j["data_quality"] = dataQuality->toJson();
    }
    return j;
}

} // namespace models
} // namespace listing_ranker
