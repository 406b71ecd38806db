#include "geo/Wgs84.hpp"
#include "geo/Lv03.hpp"
#include "geo/Lv95.hpp"
#include "geo/Projection.hpp"

namespace swissgeo::geo {

std::optional<Lv03> Wgs84::toLv03() const {
    const auto result = projection::forward(longitude, latitude, altitude);
    return Lv03::create(result.north, result.east, result.altitude);
}

std::optional<Lv95> Wgs84::toLv95() const {
    auto lv03 = toLv03();
    if (!lv03) {
        return std::nullopt;
    }
    return lv03->toLv95();
}

} // namespace swissgeo::geo
