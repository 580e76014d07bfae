#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <dla/vector.h>

#include <csm/cards/card_source.hpp>
#include <csm/color.hpp>
#include <csm/layout/layout.hpp>
#include <csm/util.hpp>

struct Config;
class JsonProvider;

/*
        Everything that describes a single run, stored as json
        Paths are used as given, relative paths resolve against the working directory
*/
struct Job
{
    fs::path m_Backface{ "backface.jpg" };
    fs::path m_NormalDir{ "normal" };
    fs::path m_DoubleFacedDir{ "double" };
    fs::path m_OutputDir{ "output_sheets" };
    std::string m_FileName{ "sheet" };

    // Empty names fall back to the defaults in the config, custom sizes win over names
    std::string m_PageSize{};
    std::optional<Size> m_CustomPageSize{ std::nullopt };
    std::string m_CardSize{};
    std::optional<Size> m_CustomCardSize{ std::nullopt };
    // Defaults to the bleed of the named card size
    std::optional<Length> m_BleedEdge{ std::nullopt };

    dla::uvec2 m_CardLayout{ c_DefaultCardGrid };
    uint32_t m_DotsPerInch{ c_DefaultDotsPerInch };

    ColorRGB8 m_BorderColor{ c_ReferenceBlue };
    bool m_CuttingGuideSvg{ false };
    bool m_Deterministic{ false };

    // Both return false and log an error if the json is malformed or of an incompatible version
    bool Load(const fs::path& json_path, const JsonProvider* overrides = nullptr);
    bool LoadFromJson(std::string_view json_blob, const JsonProvider* overrides = nullptr);

    void Dump(const fs::path& json_path) const;
    std::string DumpToJson() const;

    // Throws std::invalid_argument if a named size is not known to the config
    PhysicalConstants ToPhysicalConstants(const Config& config) const;
    CardSources ToCardSources() const;
};
