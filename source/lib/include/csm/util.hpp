#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include <dla/literals.h>
#include <dla/vector.h>

namespace fs = std::filesystem;

using Length = dla::length_unit;

namespace dla::unit_name
{
struct pixel
{
    static constexpr const char* id = "pixels";
    static constexpr const char* symbol = "pixels";
};
} // namespace dla::unit_name
using pixel_tag = dla::unit_tag<dla::unit_name::pixel>;
using Pixel = dla::base_unit<pixel_tag>;

using Size = dla::tvec2<Length>;
using PixelSize = dla::tvec2<Pixel>;

// clang-format off
using namespace dla::literals;
using namespace dla::int_literals;

constexpr auto operator""_mm(long double v) { return Length{ float(v * 0.001L) }; }
constexpr auto operator""_mm(unsigned long long v) { return Length{ float(v * 0.001L) }; }

constexpr auto operator""_cm(long double v) { return Length{ float(v * 0.01L) }; }
constexpr auto operator""_cm(unsigned long long v) { return Length{ float(v * 0.01L) }; }

constexpr auto operator""_in(long double v) { return Length{ float(v * 0.0254L) }; }
constexpr auto operator""_in(unsigned long long v) { return Length{ float(v * 0.0254L) }; }

constexpr auto operator""_pts(long double v) { return 0.0138889_in * float(v); }
constexpr auto operator""_pts(unsigned long long v) { return 0.0138889_in * float(v); }

constexpr auto operator""_pix(long double v) { return Pixel(float(v)); }
constexpr auto operator""_pix(unsigned long long v) { return Pixel{ float(v) }; }

inline auto operator""_p(const char *str, size_t len) { return fs::path(str, str + len); }
inline auto operator""_p(const wchar_t *str, size_t len) { return fs::path(str, str + len); }
inline auto operator""_p(const char16_t *str, size_t len) { return fs::path(str, str + len); }
inline auto operator""_p(const char32_t *str, size_t len) { return fs::path(str, str + len); }
// clang-format on

// Extension comparison ignores ASCII case, ".PNG" matches ".png"
bool HasMatchingExtension(const fs::path& path, const std::span<const fs::path> extensions);

std::string ToLower(std::string str);

/*
        Entries directly inside path, sorted by file name so that a given directory
        state always yields the same order
        A directory that can not be read is logged and lists as empty
*/
std::vector<fs::path> ListFiles(const fs::path& path, const std::span<const fs::path> extensions);
std::vector<fs::path> ListFolders(const fs::path& path);
