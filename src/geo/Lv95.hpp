#pragma once

#include "Lv03.hpp"
#include <optional>

namespace swissgeo::geo {

// LV95 投影坐标点：LV03 平移 (+1000000, +2000000)，有效性由 LV03 保证
class Lv95 {
public:
    // 参数为平移前（LV03 框架）的坐标：先按 LV03 检查，成功后再平移
    [[nodiscard]] static std::optional<Lv95> create(double north, double east, double altitude);

    constexpr double north() const noexcept { return north_; }
    constexpr double east() const noexcept { return east_; }
    constexpr double altitude() const noexcept { return altitude_; }

    constexpr bool operator==(const Lv95&) const = default;

    [[nodiscard]] Lv03 toLv03() const noexcept;

    [[nodiscard]] Wgs84 toWgs84() const noexcept;

private:
    friend class Lv03;

    constexpr Lv95(double north, double east, double altitude) noexcept
        : north_(north), east_(east), altitude_(altitude) {}

    double north_;
    double east_;
    double altitude_;
};

} // namespace swissgeo::geo
