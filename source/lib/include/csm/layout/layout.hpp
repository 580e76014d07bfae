#pragma once

#include <cstdint>

#include <dla/vector.h>

#include <csm/util.hpp>

struct PhysicalConstants
{
    Size m_PaperSize;
    Size m_CardSize;
    Length m_BleedEdge;
};

inline constexpr PhysicalConstants c_DefaultPhysicalConstants{
    .m_PaperSize{ 329_mm, 483_mm },
    .m_CardSize{ 63_mm, 88_mm },
    .m_BleedEdge{ 4_mm },
};
inline constexpr uint32_t c_DefaultDotsPerInch{ 300 };
inline constexpr dla::uvec2 c_DefaultCardGrid{ 4, 5 };

/*
        Pixel geometry of a sheet, every size is in pixels at m_DotsPerInch
        Computed once per run and shared read-only by everything that places or cuts cards
*/
struct Layout
{
    uint32_t m_DotsPerInch;
    PhysicalConstants m_Physical;

    // x is the number of columns, y the number of rows
    dla::uvec2 m_Grid;

    dla::ivec2 m_PaperSize;
    dla::ivec2 m_CardSize;
    int32_t m_BleedEdge;

    // Always m_CardSize + 2 * m_BleedEdge, this is the pitch of the grid
    dla::ivec2 m_CardSizeWithBleed;

    dla::ivec2 m_GridFootprint;
    // May be negative if the grid overflows the paper
    dla::ivec2 m_GridOffset;
    bool m_FitsOnPaper;

    uint32_t CardsPerSheet() const;

    // Top-left corner of the bleed-inclusive slot
    dla::ivec2 SlotPosition(uint32_t column, uint32_t row) const;
};

/*
        Throws std::invalid_argument if any physical constant is not positive,
        the resolution is zero, the grid is empty or its pixel extent overflows
        Logs a warning if the grid does not fit on the paper, but still succeeds
*/
Layout ComputeLayout(const PhysicalConstants& physical, dla::uvec2 grid, uint32_t dots_per_inch);
