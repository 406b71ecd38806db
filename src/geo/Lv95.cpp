#include "geo/Lv95.hpp"
#include "geo/SwissExtent.hpp"

namespace swissgeo::geo {

std::optional<Lv95> Lv95::create(double north, double east, double altitude) {
    auto lv03 = Lv03::create(north, east, altitude);
    if (!lv03) {
        return std::nullopt;
    }
    return lv03->toLv95();
}

Lv03 Lv95::toLv03() const noexcept {
    return Lv03{north_ - kLv95NorthOffset, east_ - kLv95EastOffset, altitude_};
}

Wgs84 Lv95::toWgs84() const noexcept {
    return toLv03().toWgs84();
}

} // namespace swissgeo::geo
