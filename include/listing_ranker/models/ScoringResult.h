#pragma once

#include "DataQualityReport.h"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace listing_ranker {
namespace models {

enum class SignalKind {
    POSITIVE,
    NEGATIVE,
    WARNING   // data could not be verified; never carries a contribution
};

std::string signalKindToString(SignalKind kind);

// One itemized reason behind a score
struct Signal {
    SignalKind kind = SignalKind::POSITIVE;
    std::string label;      // machine key, e.g. "must_have:school"
    std::string message;    // human-readable detail
    double contribution = 0.0;

    bool operator==(const Signal& other) const {
        return kind == other.kind && label == other.label &&
               message == other.message && contribution == other.contribution;
    }
};

// Display text with a kind marker, e.g. "[+] Near School (400 m)"
std::string renderSignal(const Signal& signal);

struct ScoringResult {
    double score = 0.0;
    bool isDisqualified = false;
    std::optional<std::string> disqualificationReason;

    std::vector<Signal> positiveSignals;
    // Penalties and warnings, in the order they were raised
    std::vector<Signal> negativeSignals;

    // Label -> summed contribution; sums to score unless disqualified
    std::map<std::string, double> scoreBreakdown;

    std::optional<DataQualityReport> dataQuality;

    void addPositive(const std::string& label, const std::string& message, double delta = 0.0);
    void addNegative(const std::string& label, const std::string& message, double delta = 0.0);
    void addWarning(const std::string& label, const std::string& message);

    // Terminal: freezes the score at 0 and drops the breakdown. Signals raised
    // before the failing gate are kept for auditing.
    void disqualify(const std::string& reason);

    nlohmann::json toJson() const;

private:
    void applyDelta(const std::string& label, double delta);
};

} // namespace models
} // namespace listing_ranker
