#include "../../include/listing_ranker/geo/GeoDistance.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace listing_ranker {
namespace geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees) {
    return degrees * kPi / 180.0;
}

} // namespace

bool isValidCoordinates(const Coordinates& coords) {
    if (!std::isfinite(coords.latitude) || !std::isfinite(coords.longitude)) {
        return false;
    }
    return coords.latitude >= -90.0 && coords.latitude <= 90.0 &&
           coords.longitude >= -180.0 && coords.longitude <= 180.0;
}

double haversineDistance(const Coordinates& from, const Coordinates& to) {
    double lat1 = toRadians(from.latitude);
    double lat2 = toRadians(to.latitude);
    double dLat = lat2 - lat1;
    double dLon = toRadians(to.longitude - from.longitude);

    double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
               std::cos(lat1) * std::cos(lat2) * std::sin(dLon / 2) * std::sin(dLon / 2);
    // Rounding can push a a hair above 1 for antipodal points
    a = std::min(1.0, std::max(0.0, a));
    double c = 2 * std::asin(std::sqrt(a));
    return kEarthRadiusMeters * c;
}

std::optional<Coordinates> parseCoordinates(const std::string& text) {
    auto comma = text.find(',');
    if (comma == std::string::npos) {
        return std::nullopt;
    }

    Coordinates coords;
    try {
        size_t consumed = 0;
        std::string latText = text.substr(0, comma);
        std::string lngText = text.substr(comma + 1);
        coords.latitude = std::stod(latText, &consumed);
        if (latText.find_first_not_of(" \t", consumed) != std::string::npos) {
            return std::nullopt;
        }
        coords.longitude = std::stod(lngText, &consumed);
        if (lngText.find_first_not_of(" \t", consumed) != std::string::npos) {
            return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (!isValidCoordinates(coords)) {
        return std::nullopt;
    }
    return coords;
}

std::string formatDistance(double meters) {
    std::ostringstream oss;
    if (meters >= 1000.0) {
        oss << std::fixed << std::setprecision(1) << (meters / 1000.0) << " km";
    } else {
        oss << std::fixed << std::setprecision(0) << meters << " m";
    }
    return oss.str();
}

} // namespace geo
} // namespace listing_ranker
