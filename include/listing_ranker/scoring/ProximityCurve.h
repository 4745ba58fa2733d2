#pragma once

#include "../config/PoiCatalog.h"

namespace listing_ranker {
namespace scoring {

// Closeness in [0, 1] for a verified distance: 1 at the POI, 0 at the radius
// and beyond. EXPONENTIAL falls off faster than LINEAR near the edge.
double proximityFactor(double distance, double radius, config::CurveType curve);

// Factor floored at `minFactor`, so an in-range POI at the edge of its radius
// still scores above an absent one
double flooredProximityFactor(double distance, double radius, config::CurveType curve, double minFactor);

} // namespace scoring
} // namespace listing_ranker
