#include <catch2/catch_test_macros.hpp>

#include <log_capture.hpp>
#include <test_images.hpp>

#include <csm/cards/card_image.hpp>
#include <csm/layout/layout.hpp>
#include <csm/sheet/sheet_builder.hpp>

namespace
{
// Small enough to render quickly: paper 259x380, card 49x69, bleed 3, grid offset (19, 2)
inline constexpr uint32_t c_TestDotsPerInch{ 20 };

Layout MakeTestLayout()
{
    return ComputeLayout(c_DefaultPhysicalConstants, c_DefaultCardGrid, c_TestDotsPerInch);
}

dla::ivec2 SlotCenter(const Layout& layout, uint32_t column, uint32_t row)
{
    const auto position{ layout.SlotPosition(column, row) };
    return dla::ivec2{
        position.x + layout.m_CardSizeWithBleed.x / 2,
        position.y + layout.m_CardSizeWithBleed.y / 2,
    };
}
} // namespace

TEST_CASE("Cards are split into sheets", "[sheet_slices]")
{
    REQUIRE(ComputeSheetCount(0, 20) == 0);
    REQUIRE(ComputeSheetCount(1, 20) == 1);
    REQUIRE(ComputeSheetCount(20, 20) == 1);
    REQUIRE(ComputeSheetCount(21, 20) == 2);
    REQUIRE(ComputeSheetCount(45, 20) == 3);

    const SheetSlice first{ ComputeSheetSlice(0, 20, 45) };
    REQUIRE(first.m_Begin == 0);
    REQUIRE(first.m_End == 20);

    const SheetSlice second{ ComputeSheetSlice(1, 20, 45) };
    REQUIRE(second.m_Begin == 20);
    REQUIRE(second.m_End == 40);

    const SheetSlice last{ ComputeSheetSlice(2, 20, 45) };
    REQUIRE(last.m_Begin == 40);
    REQUIRE(last.m_End == 45);
    REQUIRE(last.Size() == 5);
}

TEST_CASE("Back side mirrors columns", "[sheet_placements]")
{
    LogCapture log;

    const Layout layout{ MakeTestLayout() };

    const auto front{ ComputeSlotPlacements(layout, 1, 27, SheetSide::Front) };
    const auto back{ ComputeSlotPlacements(layout, 1, 27, SheetSide::Back) };
    REQUIRE(front.size() == 7);
    REQUIRE(back.size() == 7);

    for (size_t i = 0; i < front.size(); i++)
    {
        REQUIRE(front[i].m_CardIndex == 20 + i);
        REQUIRE(back[i].m_CardIndex == front[i].m_CardIndex);
        REQUIRE(front[i].m_Row == i / 4);
        REQUIRE(front[i].m_Column == i % 4);
        REQUIRE(back[i].m_Row == front[i].m_Row);
        REQUIRE(back[i].m_Column == 3 - front[i].m_Column);
        REQUIRE(back[i].m_Position == layout.SlotPosition(back[i].m_Column, back[i].m_Row));
    }

    REQUIRE(front[0].m_Position == dla::ivec2{ 19, 2 });
    REQUIRE(back[0].m_Position == dla::ivec2{ 19 + 3 * 55, 2 });
}

TEST_CASE("Sheet is rendered onto a white canvas", "[sheet_render]")
{
    LogCapture log;

    const TempDirectory root{ "sheet_render" };
    const fs::path backface{ root / "backface.png" };
    REQUIRE(WriteSolidImage(backface, 63, 88, c_TestGreen));

    CardPairList cards;
    for (int i = 0; i < 5; i++)
    {
        const fs::path front{ root / fmt::format("front_{}.png", i) };
        REQUIRE(WriteSolidImage(front, 63, 88, c_TestRed));
        cards.push_back(CardPair{ front, backface });
    }

    const Layout layout{ MakeTestLayout() };
    const std::vector<fs::path> shared_images{ FindSharedImages(cards) };
    PreparedCardCache cache{ shared_images };

    SECTION("Front")
    {
        SheetBuildReport report{};
        const Image sheet{ BuildSheet(cards, 0, layout, SheetSide::Front, cache, {}, &report) };
        REQUIRE(sheet.Width() == Pixel(static_cast<float>(layout.m_PaperSize.x)));
        REQUIRE(sheet.Height() == Pixel(static_cast<float>(layout.m_PaperSize.y)));
        REQUIRE(report.m_FallbackImages.empty());

        // Paper margin
        REQUIRE(sheet.PixelAt(0, 0) == c_White);
        REQUIRE(sheet.PixelAt(layout.m_PaperSize.x - 1, layout.m_PaperSize.y - 1) == c_White);

        // Reference border, then bleed, then the card itself
        const auto slot{ layout.SlotPosition(0, 0) };
        REQUIRE(sheet.PixelAt(slot.x, slot.y) == c_ReferenceBlue);
        REQUIRE(sheet.PixelAt(slot.x + 1, slot.y + 1) == c_Black);
        const auto center{ SlotCenter(layout, 0, 0) };
        REQUIRE(IsClose(sheet.PixelAt(center.x, center.y), c_TestRed));

        // Fifth card starts the second row, the slot after it stays empty
        const auto fifth_center{ SlotCenter(layout, 0, 1) };
        REQUIRE(IsClose(sheet.PixelAt(fifth_center.x, fifth_center.y), c_TestRed));
        const auto empty_center{ SlotCenter(layout, 1, 1) };
        REQUIRE(sheet.PixelAt(empty_center.x, empty_center.y) == c_White);
    }

    SECTION("Back")
    {
        const Image sheet{ BuildSheet(cards, 0, layout, SheetSide::Back, cache) };
        REQUIRE(sheet.Width() == Pixel(static_cast<float>(layout.m_PaperSize.x)));
        REQUIRE(sheet.Height() == Pixel(static_cast<float>(layout.m_PaperSize.y)));

        const auto mirrored_center{ SlotCenter(layout, 3, 0) };
        REQUIRE(IsClose(sheet.PixelAt(mirrored_center.x, mirrored_center.y), c_TestGreen));
        const auto unused_center{ SlotCenter(layout, 0, 1) };
        REQUIRE(sheet.PixelAt(unused_center.x, unused_center.y) == c_White);
        const auto fifth_center{ SlotCenter(layout, 3, 1) };
        REQUIRE(IsClose(sheet.PixelAt(fifth_center.x, fifth_center.y), c_TestGreen));

        // The backface is prepared once for all five cards
        REQUIRE(cache.Size() == 1);
    }
}

TEST_CASE("Broken card images are replaced and reported", "[sheet_fallback]")
{
    LogCapture log;

    const TempDirectory root{ "sheet_fallback" };
    const fs::path good_front{ root / "good.png" };
    const fs::path missing_front{ root / "missing.png" };
    const fs::path backface{ root / "backface.png" };
    REQUIRE(WriteSolidImage(good_front, 63, 88, c_TestRed));
    REQUIRE(WriteSolidImage(backface, 63, 88, c_TestGreen));

    const CardPairList cards{
        CardPair{ good_front, backface },
        CardPair{ missing_front, backface },
    };

    const Layout layout{ MakeTestLayout() };
    PreparedCardCache cache{};
    SheetBuildReport report{};
    const Image sheet{ BuildSheet(cards, 0, layout, SheetSide::Front, cache, {}, &report) };

    REQUIRE(report.m_FallbackImages.size() == 1);
    REQUIRE(report.m_FallbackImages[0] == missing_front);
    REQUIRE(log.Contains(Log::LogLevel::Warning, "missing.png"));

    // Placeholder is white inside a black bleed and still gets its border
    const auto slot{ layout.SlotPosition(1, 0) };
    REQUIRE(sheet.PixelAt(slot.x, slot.y) == c_ReferenceBlue);
    REQUIRE(sheet.PixelAt(slot.x + 1, slot.y + 1) == c_Black);
    const auto center{ SlotCenter(layout, 1, 0) };
    REQUIRE(sheet.PixelAt(center.x, center.y) == c_White);
}

TEST_CASE("Custom sheet colors", "[sheet_colors]")
{
    LogCapture log;

    const TempDirectory root{ "sheet_colors" };
    const fs::path front{ root / "front.png" };
    REQUIRE(WriteSolidImage(front, 63, 88, c_TestRed));

    const CardPairList cards{ CardPair{ front, front } };
    const Layout layout{ MakeTestLayout() };
    PreparedCardCache cache{};

    const SheetOptions options{
        .m_BackgroundColor{ 10, 20, 30 },
        .m_BorderColor{ 200, 100, 0 },
    };
    const Image sheet{ BuildSheet(cards, 0, layout, SheetSide::Front, cache, options) };

    REQUIRE(sheet.PixelAt(0, 0) == ColorRGB8{ 10, 20, 30 });
    const auto slot{ layout.SlotPosition(0, 0) };
    REQUIRE(sheet.PixelAt(slot.x, slot.y) == ColorRGB8{ 200, 100, 0 });
}
