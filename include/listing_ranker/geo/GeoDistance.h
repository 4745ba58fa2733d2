#pragma once

#include <optional>
#include <string>

namespace listing_ranker {
namespace geo {

constexpr double kEarthRadiusMeters = 6371000.0;

struct Coordinates {
    double latitude = 0.0;
    double longitude = 0.0;

    bool operator==(const Coordinates& other) const {
        return latitude == other.latitude && longitude == other.longitude;
    }
};

// Latitude in [-90, 90], longitude in [-180, 180], both finite
bool isValidCoordinates(const Coordinates& coords);

// Great-circle distance in meters (haversine formula)
double haversineDistance(const Coordinates& from, const Coordinates& to);

// Parses "lat,lng" as produced by geocoders and CLI flags
std::optional<Coordinates> parseCoordinates(const std::string& text);

// "1.2 km" / "850 m"
std::string formatDistance(double meters);

} // namespace geo
} // namespace listing_ranker
