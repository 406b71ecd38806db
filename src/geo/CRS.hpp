#pragma once

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace swissgeo::geo {

// 支持的坐标系
enum class SwissCrs {
    Wgs84,  // EPSG:4326
    Lv03,   // EPSG:21781
    Lv95    // EPSG:2056
};

// 原始坐标三元组：WGS84 为 (lon, lat, alt)，LV03/LV95 为 (north, east, alt)
using Coordinate = std::array<double, 3>;

// 坐标参考系统类
class CRS {
public:
    explicit CRS(SwissCrs kind) noexcept : kind_(kind) {}

    SwissCrs kind() const noexcept { return kind_; }

    // 获取 EPSG 代码
    std::string_view code() const noexcept;

    // 判断是否为地理坐标系
    bool isGeographic() const noexcept { return kind_ == SwissCrs::Wgs84; }

    // 判断是否为投影坐标系
    bool isProjected() const noexcept { return !isGeographic(); }

    // 获取单位（米、度）
    std::string getUnit() const;

    bool operator==(const CRS&) const = default;

private:
    SwissCrs kind_;
};

// 坐标转换器
class CoordinateTransformer {
public:
    CoordinateTransformer(const CRS& sourceCRS, const CRS& targetCRS) noexcept
        : sourceCRS_(sourceCRS), targetCRS_(targetCRS) {}

    const CRS& source() const noexcept { return sourceCRS_; }
    const CRS& target() const noexcept { return targetCRS_; }

    // 转换单个点；源坐标不在瑞士范围内时返回空
    [[nodiscard]] std::optional<Coordinate> transform(const Coordinate& coords) const;

    // 批量转换，跳过失败的点
    [[nodiscard]] std::vector<Coordinate> transform(std::span<const Coordinate> coords) const;

private:
    CRS sourceCRS_;
    CRS targetCRS_;
};

// 常用的坐标参考系统
namespace crs {
    inline const CRS WGS84{SwissCrs::Wgs84};
    inline const CRS LV03{SwissCrs::Lv03};
    inline const CRS LV95{SwissCrs::Lv95};
}

// 工厂函数：只接受规范形式 "EPSG:xxxx"
[[nodiscard]] std::optional<CRS> createCRS(std::string_view code);

// 辅助函数：从字符串解析 CRS（忽略大小写和首尾空白，支持别名）
[[nodiscard]] std::optional<CRS> parseCRSFromString(std::string_view crsString);

// 辅助函数：检查 CRS 是否有效
[[nodiscard]] bool isValidCRS(std::string_view code) noexcept;

// 辅助函数：获取支持的 CRS 列表
[[nodiscard]] std::vector<std::string> getSupportedCRS();

} // namespace swissgeo::geo
