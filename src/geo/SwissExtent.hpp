#pragma once

namespace swissgeo::geo {

// LV03 投影坐标的有效范围（米）
struct SwissExtent {
    double minNorth{0.0};
    double minEast{0.0};
    double maxNorth{0.0};
    double maxEast{0.0};

    constexpr SwissExtent() = default;
    constexpr SwissExtent(double minNorth, double minEast, double maxNorth, double maxEast)
        : minNorth(minNorth), minEast(minEast), maxNorth(maxNorth), maxEast(maxEast) {}

    // 查询方法
    constexpr double width() const noexcept { return maxEast - minEast; }
    constexpr double height() const noexcept { return maxNorth - minNorth; }

    // NaN 视为低于最小范围
    constexpr bool belowMinimum(double north, double east) const noexcept {
        return !(north >= minNorth && east >= minEast);
    }

    constexpr bool aboveMaximum(double north, double east) const noexcept {
        return north > maxNorth || east > maxEast;
    }

    constexpr bool contains(double north, double east) const noexcept {
        return !belowMinimum(north, east) && !aboveMaximum(north, east);
    }

    // 平移后的范围（LV03 -> LV95）
    constexpr SwissExtent shifted(double dNorth, double dEast) const noexcept {
        return SwissExtent{minNorth + dNorth, minEast + dEast, maxNorth + dNorth, maxEast + dEast};
    }
};

// 瑞士境内 LV03 坐标的近似包围盒
inline constexpr SwissExtent kLv03Extent{70'000.0, 480'000.0, 300'000.0, 850'000.0};

// LV95 相对 LV03 的固定偏移
inline constexpr double kLv95NorthOffset = 1'000'000.0;
inline constexpr double kLv95EastOffset = 2'000'000.0;

inline constexpr SwissExtent kLv95Extent = kLv03Extent.shifted(kLv95NorthOffset, kLv95EastOffset);

} // namespace swissgeo::geo
