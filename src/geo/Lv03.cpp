#include "geo/Lv03.hpp"
#include "geo/Lv95.hpp"
#include "geo/Projection.hpp"
#include "geo/SwissExtent.hpp"
#include "core/Logging.hpp"

namespace swissgeo::geo {

namespace {
    // 拒绝原因，仅用于日志
    enum class Rejection {
        BelowMinimum,
        AboveMaximum,
        AxesSwapped
    };

    const char* toString(Rejection reason) noexcept {
        switch (reason) {
            case Rejection::BelowMinimum: return "below Swiss minimum extent";
            case Rejection::AboveMaximum: return "above Swiss maximum extent";
            case Rejection::AxesSwapped: return "north greater than east (axes swapped?)";
        }
        return "unknown";
    }

    // 按顺序检查：最小范围、最大范围、轴顺序
    std::optional<Rejection> check(double north, double east) noexcept {
        if (kLv03Extent.belowMinimum(north, east)) {
            return Rejection::BelowMinimum;
        }
        if (kLv03Extent.aboveMaximum(north, east)) {
            return Rejection::AboveMaximum;
        }
        // 瑞士境内东坐标总是大于北坐标
        if (north > east) {
            return Rejection::AxesSwapped;
        }
        return std::nullopt;
    }
}

std::optional<Lv03> Lv03::create(double north, double east, double altitude) {
    if (auto reason = check(north, east)) {
        core::logger()->debug("Rejected LV03 coordinate (north={:.3f}, east={:.3f}): {}",
                              north, east, toString(*reason));
        return std::nullopt;
    }
    return Lv03{north, east, altitude};
}

Wgs84 Lv03::toWgs84() const noexcept {
    const auto result = projection::inverse(north_, east_, altitude_);
    return Wgs84{result.longitude, result.latitude, result.altitude};
}

Lv95 Lv03::toLv95() const noexcept {
    return Lv95{north_ + kLv95NorthOffset, east_ + kLv95EastOffset, altitude_};
}

double Lv03::distanceSquared(const Lv03& other) const noexcept {
    const double dNorth = north_ - other.north_;
    const double dEast = east_ - other.east_;
    const double dAltitude = altitude_ - other.altitude_;
    return dNorth * dNorth + dEast * dEast + dAltitude * dAltitude;
}

} // namespace swissgeo::geo
