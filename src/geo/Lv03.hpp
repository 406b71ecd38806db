#pragma once

#include "Wgs84.hpp"
#include <optional>

namespace swissgeo::geo {

class Lv95;

/**
 * LV03 投影坐标点（米）。
 *
 * 只能通过 create() 构造，保证：
 *   north ∈ [70000, 300000]，east ∈ [480000, 850000]，north <= east。
 * 三种拒绝原因对调用者不可区分，只记录在 debug 日志中。
 */
class Lv03 {
public:
    [[nodiscard]] static std::optional<Lv03> create(double north, double east, double altitude);

    // 访问器（只读）
    constexpr double north() const noexcept { return north_; }
    constexpr double east() const noexcept { return east_; }
    constexpr double altitude() const noexcept { return altitude_; }

    constexpr bool operator==(const Lv03&) const = default;

    // 反向投影，总是成功
    [[nodiscard]] Wgs84 toWgs84() const noexcept;

    // 平移到 LV95，无损
    [[nodiscard]] Lv95 toLv95() const noexcept;

    // 三维欧氏距离的平方（north/east/altitude 视为正交坐标）
    [[nodiscard]] double distanceSquared(const Lv03& other) const noexcept;

private:
    friend class Lv95;

    constexpr Lv03(double north, double east, double altitude) noexcept
        : north_(north), east_(east), altitude_(altitude) {}

    double north_;     // X
    double east_;      // Y
    double altitude_;
};

} // namespace swissgeo::geo
