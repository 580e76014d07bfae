#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <dla/vector.h>

#include <nlohmann/json_fwd.hpp>

using ColorRGB8 = dla::tvec3<uint8_t>;

inline constexpr ColorRGB8 c_White{ 255, 255, 255 };
inline constexpr ColorRGB8 c_Black{ 0, 0, 0 };
inline constexpr ColorRGB8 c_ReferenceBlue{ 0, 0, 255 };

nlohmann::json ColorToJson(const ColorRGB8& color);
// Expects an array of three integers in [0, 255]
std::optional<ColorRGB8> ColorFromJson(const nlohmann::json& json);
