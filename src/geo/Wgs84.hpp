#pragma once

#include <optional>

namespace swissgeo::geo {

class Lv03;
class Lv95;

// WGS84 地理坐标点（度、度、米），构造时不做检查
struct Wgs84 {
    double longitude{0.0};
    double latitude{0.0};
    double altitude{0.0};  // 海拔高度（米）

    constexpr Wgs84() = default;
    constexpr Wgs84(double lon, double lat, double alt = 0.0)
        : longitude(lon), latitude(lat), altitude(alt) {}

    constexpr bool operator==(const Wgs84&) const = default;

    // 正向投影；结果不在瑞士范围内时返回空
    [[nodiscard]] std::optional<Lv03> toLv03() const;

    [[nodiscard]] std::optional<Lv95> toLv95() const;
};

} // namespace swissgeo::geo
