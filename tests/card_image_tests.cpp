#include <catch2/catch_test_macros.hpp>

#include <log_capture.hpp>
#include <test_images.hpp>

#include <csm/cards/card_image.hpp>

namespace
{
inline constexpr dla::ivec2 c_CardSize{ 50, 70 };
inline constexpr int32_t c_Bleed{ 3 };

void RequireCardGeometry(const Image& image)
{
    REQUIRE(image.Valid());
    REQUIRE(image.Channels() == 3);
    REQUIRE(image.Width() == Pixel(static_cast<float>(c_CardSize.x + 2 * c_Bleed)));
    REQUIRE(image.Height() == Pixel(static_cast<float>(c_CardSize.y + 2 * c_Bleed)));
}
} // namespace

TEST_CASE("Card is scaled, cropped and bordered", "[card_image_prepare]")
{
    LogCapture log;

    const TempDirectory root{ "card_image_prepare" };
    const fs::path image_path{ root / "card.png" };
    REQUIRE(WriteSolidImage(image_path, 200, 100, c_TestRed));

    const PreparedCard card{ PrepareCard(image_path, c_CardSize, c_Bleed) };
    REQUIRE(card.m_Status == PrepareStatus::Success);
    REQUIRE(!card.IsFallback());
    REQUIRE(card.m_FailureReason.empty());
    RequireCardGeometry(card.m_Image);

    // Bleed is black, the card area is the image
    REQUIRE(card.m_Image.PixelAt(0, 0) == c_Black);
    REQUIRE(card.m_Image.PixelAt(c_Bleed - 1, c_Bleed + 10) == c_Black);
    REQUIRE(IsClose(card.m_Image.PixelAt(c_Bleed + c_CardSize.x / 2, c_Bleed + c_CardSize.y / 2), c_TestRed));
    REQUIRE(IsClose(card.m_Image.PixelAt(c_Bleed, c_Bleed), c_TestRed));

    REQUIRE(log.Count(Log::LogLevel::Warning) == 0);
}

TEST_CASE("Card is cropped around its center", "[card_image_center_crop]")
{
    LogCapture log;

    // Red on the left, green on the right, wide enough that the scaled image has to be cropped horizontally
    const TempDirectory root{ "card_image_center_crop" };
    const fs::path image_path{ root / "card.png" };
    {
        cv::Mat split{ 100, 200, CV_8UC3, cv::Scalar(0, 0, 255) };
        split(cv::Rect{ 100, 0, 100, 100 }).setTo(cv::Scalar(0, 255, 0));
        REQUIRE(Image{ split }.Write(image_path));
    }

    const PreparedCard card{ PrepareCard(image_path, c_CardSize, c_Bleed) };
    REQUIRE(card.m_Status == PrepareStatus::Success);
    RequireCardGeometry(card.m_Image);

    // Scaled to 140x70 and cropped by 45 pixels on either side, the seam stays in the middle
    const int32_t center_y{ c_Bleed + c_CardSize.y / 2 };
    REQUIRE(IsClose(card.m_Image.PixelAt(c_Bleed + 5, center_y), c_TestRed));
    REQUIRE(IsClose(card.m_Image.PixelAt(c_Bleed + c_CardSize.x - 6, center_y), c_TestGreen));
}

TEST_CASE("Grayscale and transparent images are accepted", "[card_image_channels]")
{
    LogCapture log;

    const TempDirectory root{ "card_image_channels" };

    const fs::path gray_path{ root / "gray.png" };
    REQUIRE(Image{ cv::Mat{ 80, 60, CV_8UC1, cv::Scalar(128) } }.Write(gray_path));
    const PreparedCard gray_card{ PrepareCard(gray_path, c_CardSize, c_Bleed) };
    REQUIRE(gray_card.m_Status == PrepareStatus::Success);
    RequireCardGeometry(gray_card.m_Image);

    const fs::path alpha_path{ root / "alpha.png" };
    REQUIRE(Image{ cv::Mat{ 80, 60, CV_8UC4, cv::Scalar(255, 0, 0, 128) } }.Write(alpha_path));
    const PreparedCard alpha_card{ PrepareCard(alpha_path, c_CardSize, c_Bleed) };
    REQUIRE(alpha_card.m_Status == PrepareStatus::Success);
    RequireCardGeometry(alpha_card.m_Image);
}

TEST_CASE("Missing image falls back to a placeholder", "[card_image_missing]")
{
    LogCapture log;

    const TempDirectory root{ "card_image_missing" };
    const fs::path image_path{ root / "does_not_exist.png" };

    PreparedCard card{};
    REQUIRE_NOTHROW(card = PrepareCard(image_path, c_CardSize, c_Bleed));
    REQUIRE(card.m_Status == PrepareStatus::Fallback);
    REQUIRE(card.IsFallback());
    REQUIRE(!card.m_FailureReason.empty());
    RequireCardGeometry(card.m_Image);

    REQUIRE(card.m_Image.PixelAt(0, 0) == c_Black);
    REQUIRE(card.m_Image.PixelAt(c_Bleed + 10, c_Bleed + 10) == c_White);

    REQUIRE(log.Contains(Log::LogLevel::Warning, "does_not_exist.png"));
}

TEST_CASE("Undecodable image falls back to a placeholder", "[card_image_corrupt]")
{
    LogCapture log;

    const TempDirectory root{ "card_image_corrupt" };
    const fs::path image_path{ root / "corrupt.png" };
    WriteTextFile(image_path, "this is not a png");

    const PreparedCard card{ PrepareCard(image_path, c_CardSize, c_Bleed) };
    REQUIRE(card.IsFallback());
    RequireCardGeometry(card.m_Image);
    REQUIRE(log.Contains(Log::LogLevel::Warning, "corrupt.png"));
}

TEST_CASE("Only shared images are cached", "[card_image_cache]")
{
    LogCapture log;

    const TempDirectory root{ "card_image_cache" };
    const fs::path shared_path{ root / "backface.png" };
    const fs::path single_path{ root / "front.png" };
    REQUIRE(WriteSolidImage(shared_path, 60, 80, c_TestGreen));
    REQUIRE(WriteSolidImage(single_path, 60, 80, c_TestRed));

    const std::vector<fs::path> shared_images{ shared_path };
    PreparedCardCache cache{ shared_images };
    REQUIRE(cache.IsShared(shared_path));
    REQUIRE(!cache.IsShared(single_path));

    const auto first{ cache.Get(shared_path, c_CardSize, c_Bleed) };
    const auto second{ cache.Get(shared_path, c_CardSize, c_Bleed) };
    REQUIRE(first == second);
    REQUIRE(cache.Size() == 1);

    const auto single{ cache.Get(single_path, c_CardSize, c_Bleed) };
    REQUIRE(single != nullptr);
    REQUIRE(single->m_Status == PrepareStatus::Success);
    REQUIRE(cache.Size() == 1);

    // A different size is a different entry
    const auto other_size{ cache.Get(shared_path, dla::ivec2{ 40, 60 }, c_Bleed) };
    REQUIRE(other_size != first);
    REQUIRE(cache.Size() == 2);
}
