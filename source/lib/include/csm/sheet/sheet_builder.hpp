#pragma once

#include <cstdint>
#include <vector>

#include <dla/vector.h>

#include <csm/cards/card_source.hpp>
#include <csm/color.hpp>
#include <csm/image.hpp>

struct Layout;
class PreparedCardCache;

enum class SheetSide
{
    Front,
    Back,
};

struct SheetSlice
{
    size_t m_Begin;
    size_t m_End;

    size_t Size() const;
};

size_t ComputeSheetCount(size_t total_cards, size_t cards_per_sheet);

// Cards [i * cards_per_sheet, min((i + 1) * cards_per_sheet, total_cards))
SheetSlice ComputeSheetSlice(size_t sheet_index, size_t cards_per_sheet, size_t total_cards);

struct SlotPlacement
{
    size_t m_CardIndex;
    uint32_t m_Row;
    uint32_t m_Column;
    // Top-left corner of the bleed-inclusive footprint on the canvas
    dla::ivec2 m_Position;
};

/*
        Slots are filled row by row, left to right
        On the back side columns are mirrored so that a card's back lands behind its front
        when the sheet is flipped along its vertical axis
*/
std::vector<SlotPlacement> ComputeSlotPlacements(const Layout& layout, size_t sheet_index, size_t total_cards, SheetSide side);

struct SheetOptions
{
    ColorRGB8 m_BackgroundColor{ c_White };
    ColorRGB8 m_BorderColor{ c_ReferenceBlue };
};

struct SheetBuildReport
{
    std::vector<fs::path> m_FallbackImages;
};

/*
        Renders one side of a sheet, the result has exactly the paper size of the layout
        Every placed card gets a 1px reference border along the edge of its footprint
*/
Image BuildSheet(const CardPairList& cards,
                 size_t sheet_index,
                 const Layout& layout,
                 SheetSide side,
                 PreparedCardCache& card_cache,
                 const SheetOptions& options = {},
                 SheetBuildReport* report = nullptr);
