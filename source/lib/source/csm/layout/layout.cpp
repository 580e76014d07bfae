#include <csm/layout/layout.hpp>

#include <limits>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

#include <csm/layout/unit_converter.hpp>
#include <csm/util/log.hpp>

namespace
{
int32_t FloorDiv(int32_t numerator, int32_t denominator)
{
    const int32_t quotient{ numerator / denominator };
    const bool has_remainder{ quotient * denominator != numerator };
    const bool is_negative{ (numerator < 0) != (denominator < 0) };
    return has_remainder && is_negative ? quotient - 1 : quotient;
}

void ValidatePhysicalConstants(const PhysicalConstants& physical)
{
    const auto require_positive{
        [](Length length, std::string_view name)
        {
            if (!(length > 0_mm))
            {
                throw std::invalid_argument{
                    fmt::format("{} must be positive, got {}mm", name, length / 1_mm)
                };
            }
        }
    };
    require_positive(physical.m_PaperSize.x, "Paper width");
    require_positive(physical.m_PaperSize.y, "Paper height");
    require_positive(physical.m_CardSize.x, "Card width");
    require_positive(physical.m_CardSize.y, "Card height");
    require_positive(physical.m_BleedEdge, "Bleed edge");
}

void ValidateGrid(dla::uvec2 grid)
{
    if (grid.x == 0 || grid.y == 0)
    {
        throw std::invalid_argument{
            fmt::format("Card grid must hold at least one card, got {}x{}", grid.x, grid.y)
        };
    }

    const uint64_t cards_per_sheet{ static_cast<uint64_t>(grid.x) * grid.y };
    if (cards_per_sheet > std::numeric_limits<uint32_t>::max())
    {
        throw std::invalid_argument{
            fmt::format("Card grid {}x{} holds too many cards", grid.x, grid.y)
        };
    }
}

int32_t GridExtent(uint32_t count, int32_t pitch, std::string_view axis)
{
    const int64_t extent{ static_cast<int64_t>(count) * pitch };
    if (extent > std::numeric_limits<int32_t>::max())
    {
        throw std::invalid_argument{
            fmt::format("Card grid is too large, {} cards of {}px exceed the pixel range in {}", count, pitch, axis)
        };
    }
    return static_cast<int32_t>(extent);
}
} // namespace

uint32_t Layout::CardsPerSheet() const
{
    return m_Grid.x * m_Grid.y;
}

dla::ivec2 Layout::SlotPosition(uint32_t column, uint32_t row) const
{
    return dla::ivec2{
        m_GridOffset.x + static_cast<int32_t>(column) * m_CardSizeWithBleed.x,
        m_GridOffset.y + static_cast<int32_t>(row) * m_CardSizeWithBleed.y,
    };
}

Layout ComputeLayout(const PhysicalConstants& physical, dla::uvec2 grid, uint32_t dots_per_inch)
{
    ValidatePhysicalConstants(physical);
    if (dots_per_inch == 0)
    {
        throw std::invalid_argument{ "Resolution must be positive" };
    }
    ValidateGrid(grid);

    Layout layout{};
    layout.m_DotsPerInch = dots_per_inch;
    layout.m_Physical = physical;
    layout.m_Grid = grid;

    layout.m_PaperSize = dla::ivec2{
        ToPixels(physical.m_PaperSize.x, dots_per_inch),
        ToPixels(physical.m_PaperSize.y, dots_per_inch),
    };
    layout.m_CardSize = dla::ivec2{
        ToPixels(physical.m_CardSize.x, dots_per_inch),
        ToPixels(physical.m_CardSize.y, dots_per_inch),
    };
    layout.m_BleedEdge = ToPixels(physical.m_BleedEdge, dots_per_inch);
    layout.m_CardSizeWithBleed = dla::ivec2{
        layout.m_CardSize.x + 2 * layout.m_BleedEdge,
        layout.m_CardSize.y + 2 * layout.m_BleedEdge,
    };

    layout.m_GridFootprint = dla::ivec2{
        GridExtent(grid.x, layout.m_CardSizeWithBleed.x, "width"),
        GridExtent(grid.y, layout.m_CardSizeWithBleed.y, "height"),
    };
    layout.m_GridOffset = dla::ivec2{
        FloorDiv(layout.m_PaperSize.x - layout.m_GridFootprint.x, 2),
        FloorDiv(layout.m_PaperSize.y - layout.m_GridFootprint.y, 2),
    };
    layout.m_FitsOnPaper = layout.m_GridFootprint.x <= layout.m_PaperSize.x &&
                           layout.m_GridFootprint.y <= layout.m_PaperSize.y;

    LogInfo("Paper: {}x{}mm = {}x{}px",
            ToMillimeters(physical.m_PaperSize.x),
            ToMillimeters(physical.m_PaperSize.y),
            layout.m_PaperSize.x,
            layout.m_PaperSize.y);
    LogInfo("Cards: {}x{}mm + {}mm bleed = {}x{}px",
            ToMillimeters(physical.m_CardSize.x),
            ToMillimeters(physical.m_CardSize.y),
            ToMillimeters(physical.m_BleedEdge),
            layout.m_CardSizeWithBleed.x,
            layout.m_CardSizeWithBleed.y);
    LogInfo("Layout: {}x{} grid = {} cards per sheet at {} dpi",
            grid.x,
            grid.y,
            layout.CardsPerSheet(),
            dots_per_inch);
    const double bleed_mm{ ToMillimeters(physical.m_BleedEdge) };
    const double footprint_width_mm{ grid.x * (ToMillimeters(physical.m_CardSize.x) + 2 * bleed_mm) };
    const double footprint_height_mm{ grid.y * (ToMillimeters(physical.m_CardSize.y) + 2 * bleed_mm) };
    LogInfo("Space used: {:.1f}x{:.1f}mm of {}x{}mm = {}x{}px of {}x{}px",
            footprint_width_mm,
            footprint_height_mm,
            ToMillimeters(physical.m_PaperSize.x),
            ToMillimeters(physical.m_PaperSize.y),
            layout.m_GridFootprint.x,
            layout.m_GridFootprint.y,
            layout.m_PaperSize.x,
            layout.m_PaperSize.y);

    if (!layout.m_FitsOnPaper)
    {
        LogWarning("Cards might not fit! The grid needs {}x{}px but the paper only has {}x{}px",
                   layout.m_GridFootprint.x,
                   layout.m_GridFootprint.y,
                   layout.m_PaperSize.x,
                   layout.m_PaperSize.y);
    }

    return layout;
}
