#pragma once

#include <array>
#include <optional>
#include <string_view>

#include <csm/util.hpp>

enum class Unit
{
    Millimeter,
    Centimeter,
    Inches,
    Points,
};

struct UnitInfo
{
    Unit m_Unit;
    Length m_Value;
    // Used when writing sizes, either name is accepted when reading
    std::string_view m_Name;
    std::string_view m_ShortName;
};

inline constexpr std::array c_Units{
    UnitInfo{ Unit::Millimeter, 1_mm, "mm", "mm" },
    UnitInfo{ Unit::Centimeter, 1_cm, "cm", "cm" },
    UnitInfo{ Unit::Inches, 1_in, "inches", "in" },
    UnitInfo{ Unit::Points, 1_pts, "points", "pts" },
};

constexpr const UnitInfo& GetUnitInfo(Unit unit)
{
    return c_Units[static_cast<size_t>(unit)];
}

constexpr Length UnitValue(Unit unit)
{
    return GetUnitInfo(unit).m_Value;
}

constexpr std::string_view UnitName(Unit unit)
{
    return GetUnitInfo(unit).m_Name;
}

constexpr std::optional<Unit> UnitFromName(std::string_view unit_name)
{
    for (const UnitInfo& info : c_Units)
    {
        if (info.m_Name == unit_name || info.m_ShortName == unit_name)
        {
            return info.m_Unit;
        }
    }
    return std::nullopt;
}
