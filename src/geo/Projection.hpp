#pragma once

namespace swissgeo::geo::projection {

// 投影计算的中间结果（平面坐标 + 高程）
struct PlanarResult {
    double north{0.0};
    double east{0.0};
    double altitude{0.0};
};

// 投影计算的中间结果（经纬度 + 高程）
struct AngularResult {
    double longitude{0.0};
    double latitude{0.0};
    double altitude{0.0};
};

// 辅助角度单位：以伯尔尼为原点、缩放 10000 倍的角秒
struct AuxiliaryAngles {
    double phi{0.0};
    double lambda{0.0};
};

// 辅助平面单位：以 (200000, 600000) 为原点、单位为 1000 km
struct AuxiliaryPlane {
    double x{0.0};
    double y{0.0};
};

[[nodiscard]] AuxiliaryAngles toAuxiliaryAngles(double longitude, double latitude) noexcept;

[[nodiscard]] AuxiliaryPlane toAuxiliaryPlane(double north, double east) noexcept;

// 纯函数：WGS84 -> LV03 近似公式（不做有效性检查）
[[nodiscard]] PlanarResult forward(double longitude, double latitude, double altitude) noexcept;

// 纯函数：LV03 -> WGS84 近似公式
[[nodiscard]] AngularResult inverse(double north, double east, double altitude) noexcept;

} // namespace swissgeo::geo::projection
