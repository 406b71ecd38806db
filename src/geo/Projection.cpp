#include "geo/Projection.hpp"

namespace swissgeo::geo::projection {

namespace {
    // 伯尔尼原点（角秒）
    constexpr double BERN_LATITUDE_SECONDS = 169028.66;
    constexpr double BERN_LONGITUDE_SECONDS = 26782.5;
    constexpr double ANGLE_SCALE = 10000.0;

    // LV03 原点（米）
    constexpr double ORIGIN_NORTH = 200000.0;
    constexpr double ORIGIN_EAST = 600000.0;
    constexpr double PLANE_SCALE = 1000000.0;

    // 公式中的假东/假北偏移
    constexpr double FALSE_EASTING = 2000000.0;
    constexpr double FALSE_NORTHING = 1000000.0;

    // 10000 角秒 -> 度
    constexpr double toDegrees(double auxiliary) {
        return auxiliary * 100.0 / 36.0;
    }
}

AuxiliaryAngles toAuxiliaryAngles(double longitude, double latitude) noexcept {
    return AuxiliaryAngles{
        (3600.0 * latitude - BERN_LATITUDE_SECONDS) / ANGLE_SCALE,
        (3600.0 * longitude - BERN_LONGITUDE_SECONDS) / ANGLE_SCALE
    };
}

AuxiliaryPlane toAuxiliaryPlane(double north, double east) noexcept {
    return AuxiliaryPlane{
        (north - ORIGIN_NORTH) / PLANE_SCALE,
        (east - ORIGIN_EAST) / PLANE_SCALE
    };
}

PlanarResult forward(double longitude, double latitude, double altitude) noexcept {
    const auto [phi, lambda] = toAuxiliaryAngles(longitude, latitude);
    const double phi2 = phi * phi;
    const double phi3 = phi * phi2;
    const double lambda2 = lambda * lambda;
    const double lambda3 = lambda * lambda2;

    const double e = 2600072.37 + 211455.93 * lambda
                   - 10938.51 * lambda * phi
                   - 0.36 * lambda * phi2
                   - 44.54 * lambda3;
    const double n = 1200147.07 + 308807.95 * phi + 3745.25 * lambda2 + 76.63 * phi2
                   - 194.56 * lambda2 * phi
                   + 119.79 * phi3;

    return PlanarResult{
        n - FALSE_NORTHING,
        e - FALSE_EASTING,
        altitude - 49.55 + 2.73 * lambda + 6.94 * phi
    };
}

AngularResult inverse(double north, double east, double altitude) noexcept {
    const auto [x, y] = toAuxiliaryPlane(north, east);
    const double x2 = x * x;
    const double x3 = x * x2;
    const double y2 = y * y;
    const double y3 = y * y2;

    const double lambda = 2.6779094 + 4.728982 * y + 0.791484 * y * x + 0.1306 * y * x2 - 0.0436 * y3;
    const double phi = 16.9023892 + 3.238272 * x
                     - 0.270978 * y2
                     - 0.002528 * x2
                     - 0.0447 * y2 * x
                     - 0.0140 * x3;

    return AngularResult{
        toDegrees(lambda),
        toDegrees(phi),
        altitude + 49.55 - 12.6 * y - 22.64 * x
    };
}

} // namespace swissgeo::geo::projection
