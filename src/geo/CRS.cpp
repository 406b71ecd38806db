#include "geo/CRS.hpp"
#include "geo/Lv95.hpp"
#include "geo/SwissExtent.hpp"
#include "core/Logging.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace swissgeo::geo {

namespace {
    struct CrsEntry {
        SwissCrs kind;
        std::string_view code;
    };

    constexpr std::array<CrsEntry, 3> SUPPORTED = {{
        {SwissCrs::Wgs84, "EPSG:4326"},
        {SwissCrs::Lv03, "EPSG:21781"},
        {SwissCrs::Lv95, "EPSG:2056"},
    }};

    // 常用名称
    struct CrsAlias {
        std::string_view name;
        SwissCrs kind;
    };

    constexpr std::array<CrsAlias, 5> ALIASES = {{
        {"WGS84", SwissCrs::Wgs84},
        {"LV03", SwissCrs::Lv03},
        {"CH1903", SwissCrs::Lv03},
        {"LV95", SwissCrs::Lv95},
        {"CH1903+", SwissCrs::Lv95},
    }};

    std::string normalize(std::string_view text) {
        const auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
        auto first = std::find_if_not(text.begin(), text.end(), isSpace);
        auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();

        std::string result;
        if (first < last) {
            result.assign(first, last);
        }
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    // 所有源坐标先归一到 LV03
    std::optional<Lv03> toLv03(SwissCrs kind, const Coordinate& c) {
        switch (kind) {
            case SwissCrs::Wgs84:
                return Wgs84{c[0], c[1], c[2]}.toLv03();
            case SwissCrs::Lv03:
                return Lv03::create(c[0], c[1], c[2]);
            case SwissCrs::Lv95: {
                auto lv95 = Lv95::create(c[0] - kLv95NorthOffset, c[1] - kLv95EastOffset, c[2]);
                if (!lv95) {
                    return std::nullopt;
                }
                return lv95->toLv03();
            }
        }
        return std::nullopt;
    }

    Coordinate fromLv03(SwissCrs kind, const Lv03& p) {
        switch (kind) {
            case SwissCrs::Wgs84: {
                const auto wgs = p.toWgs84();
                return {wgs.longitude, wgs.latitude, wgs.altitude};
            }
            case SwissCrs::Lv95: {
                const auto lv95 = p.toLv95();
                return {lv95.north(), lv95.east(), lv95.altitude()};
            }
            case SwissCrs::Lv03:
                break;
        }
        return {p.north(), p.east(), p.altitude()};
    }
}

// CRS 实现
std::string_view CRS::code() const noexcept {
    for (const auto& entry : SUPPORTED) {
        if (entry.kind == kind_) {
            return entry.code;
        }
    }
    return {};
}

std::string CRS::getUnit() const {
    return isGeographic() ? "degree" : "metre";
}

// CoordinateTransformer 实现
std::optional<Coordinate> CoordinateTransformer::transform(const Coordinate& coords) const {
    // WGS84 之间不经过投影，避免近似误差
    if (sourceCRS_.isGeographic() && targetCRS_.isGeographic()) {
        return coords;
    }

    auto lv03 = toLv03(sourceCRS_.kind(), coords);
    if (!lv03) {
        return std::nullopt;
    }
    return fromLv03(targetCRS_.kind(), *lv03);
}

std::vector<Coordinate> CoordinateTransformer::transform(std::span<const Coordinate> coords) const {
    std::vector<Coordinate> result;
    result.reserve(coords.size());

    for (const auto& point : coords) {
        auto transformedPoint = transform(point);
        if (transformedPoint) {
            result.push_back(*transformedPoint);
        }
    }

    if (result.size() != coords.size()) {
        core::logger()->warn("{} -> {}: skipped {} of {} coordinates outside the Swiss extent",
                             sourceCRS_.code(), targetCRS_.code(),
                             coords.size() - result.size(), coords.size());
    }

    return result;
}

// 工厂函数实现
std::optional<CRS> createCRS(std::string_view code) {
    for (const auto& entry : SUPPORTED) {
        if (entry.code == code) {
            return CRS{entry.kind};
        }
    }
    return std::nullopt;
}

std::optional<CRS> parseCRSFromString(std::string_view crsString) {
    const std::string text = normalize(crsString);

    for (const auto& alias : ALIASES) {
        if (alias.name == text) {
            return CRS{alias.kind};
        }
    }

    // "EPSG:xxxx" 格式
    constexpr std::string_view prefix = "EPSG:";
    if (text.starts_with(prefix) && text.length() > prefix.size()) {
        const std::string digits = text.substr(prefix.size());
        // 只接受纯数字（stoi 会跳过空白并接受正负号）
        const bool allDigits = std::all_of(digits.begin(), digits.end(),
                                           [](unsigned char c) { return std::isdigit(c) != 0; });
        if (!allDigits) {
            core::logger()->debug("Invalid EPSG code: {}", crsString);
            return std::nullopt;
        }
        try {
            std::size_t consumed = 0;
            const int epsgCode = std::stoi(digits, &consumed);
            if (consumed == digits.size() && epsgCode > 0) {
                return createCRS("EPSG:" + std::to_string(epsgCode));
            }
        } catch (const std::out_of_range&) {
            core::logger()->debug("EPSG code out of range: {}", crsString);
        }
    }

    return std::nullopt;
}

bool isValidCRS(std::string_view code) noexcept {
    return std::any_of(SUPPORTED.begin(), SUPPORTED.end(),
                       [code](const CrsEntry& entry) { return entry.code == code; });
}

std::vector<std::string> getSupportedCRS() {
    std::vector<std::string> codes;
    codes.reserve(SUPPORTED.size());
    for (const auto& entry : SUPPORTED) {
        codes.emplace_back(entry.code);
    }
    return codes;
}

} // namespace swissgeo::geo
