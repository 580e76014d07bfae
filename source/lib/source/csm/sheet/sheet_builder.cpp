#include <csm/sheet/sheet_builder.hpp>

#include <algorithm>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <csm/cards/card_image.hpp>
#include <csm/layout/layout.hpp>
#include <csm/util/log.hpp>

size_t SheetSlice::Size() const
{
    return m_End - m_Begin;
}

size_t ComputeSheetCount(size_t total_cards, size_t cards_per_sheet)
{
    return (total_cards + cards_per_sheet - 1) / cards_per_sheet;
}

SheetSlice ComputeSheetSlice(size_t sheet_index, size_t cards_per_sheet, size_t total_cards)
{
    const size_t begin{ std::min(sheet_index * cards_per_sheet, total_cards) };
    const size_t end{ std::min(begin + cards_per_sheet, total_cards) };
    return SheetSlice{ begin, end };
}

std::vector<SlotPlacement> ComputeSlotPlacements(const Layout& layout, size_t sheet_index, size_t total_cards, SheetSide side)
{
    const auto columns{ layout.m_Grid.x };
    const auto slice{ ComputeSheetSlice(sheet_index, layout.CardsPerSheet(), total_cards) };

    std::vector<SlotPlacement> placements;
    placements.reserve(slice.Size());
    for (size_t i = 0; i < slice.Size(); i++)
    {
        const auto row{ static_cast<uint32_t>(i / columns) };
        const auto front_column{ static_cast<uint32_t>(i % columns) };
        const auto column{ side == SheetSide::Back ? columns - 1 - front_column : front_column };
        placements.push_back(SlotPlacement{
            slice.m_Begin + i,
            row,
            column,
            layout.SlotPosition(column, row),
        });
    }
    return placements;
}

Image BuildSheet(const CardPairList& cards,
                 size_t sheet_index,
                 const Layout& layout,
                 SheetSide side,
                 PreparedCardCache& card_cache,
                 const SheetOptions& options,
                 SheetBuildReport* report)
{
    const auto& background{ options.m_BackgroundColor };
    cv::Mat canvas{
        cv::Size{ layout.m_PaperSize.x, layout.m_PaperSize.y },
        CV_8UC3,
        cv::Scalar(background.b, background.g, background.r),
    };
    const cv::Rect canvas_rect{ 0, 0, canvas.cols, canvas.rows };

    const auto& border{ options.m_BorderColor };
    const cv::Scalar border_color{ static_cast<double>(border.b), static_cast<double>(border.g), static_cast<double>(border.r) };

    for (const SlotPlacement& placement : ComputeSlotPlacements(layout, sheet_index, cards.size(), side))
    {
        const CardPair& card{ cards[placement.m_CardIndex] };
        const fs::path& image_path{ side == SheetSide::Front ? card.m_Front : card.m_Back };

        const auto prepared_card{ card_cache.Get(image_path, layout.m_CardSize, layout.m_BleedEdge) };
        if (prepared_card->IsFallback() && report != nullptr)
        {
            report->m_FallbackImages.push_back(image_path);
        }

        const cv::Mat& card_image{ prepared_card->m_Image.GetUnderlying() };
        const cv::Rect slot_rect{
            placement.m_Position.x,
            placement.m_Position.y,
            layout.m_CardSizeWithBleed.x,
            layout.m_CardSizeWithBleed.y,
        };

        // Anything outside the paper is cut off
        const cv::Rect visible_rect{ slot_rect & canvas_rect };
        if (visible_rect.empty())
        {
            LogWarning("Card {} on sheet {} lies completely outside the paper", placement.m_CardIndex + 1, sheet_index + 1);
            continue;
        }

        const cv::Rect source_rect{ visible_rect - slot_rect.tl() };
        card_image(source_rect).copyTo(canvas(visible_rect));

        cv::rectangle(canvas, slot_rect, border_color, 1);
    }

    return Image{ std::move(canvas) };
}
