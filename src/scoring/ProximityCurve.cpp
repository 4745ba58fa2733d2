#include "../../include/listing_ranker/scoring/ProximityCurve.h"
#include <algorithm>
#include <cmath>

namespace listing_ranker {
namespace scoring {

double proximityFactor(double distance, double radius, config::CurveType curve) {
    if (!(radius > 0) || !std::isfinite(distance)) {
        return 0.0;
    }
    double linear = std::clamp(1.0 - std::max(distance, 0.0) / radius, 0.0, 1.0);
    switch (curve) {
        case config::CurveType::EXPONENTIAL:
            return linear * linear;
        case config::CurveType::LINEAR:
            return linear;
    }
    return linear;
}

double flooredProximityFactor(double distance, double radius, config::CurveType curve, double minFactor) {
    return std::max(minFactor, proximityFactor(distance, radius, curve));
}

} // namespace scoring
} // namespace listing_ranker
