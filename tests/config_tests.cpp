#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <log_capture.hpp>
#include <test_images.hpp>

#include <csm/config.hpp>

using Catch::Matchers::WithinAbs;

TEST_CASE("Size strings are parsed", "[config_parse_size]")
{
    {
        const auto info{ ParseSizeInfo("329 x 483 mm") };
        REQUIRE(info.has_value());
        REQUIRE_THAT(info->m_Dimensions.x / 1_mm, WithinAbs(329.0, 1e-3));
        REQUIRE_THAT(info->m_Dimensions.y / 1_mm, WithinAbs(483.0, 1e-3));
        REQUIRE(info->m_BaseUnit == Unit::Millimeter);
        REQUIRE(info->m_Decimals == 0);
        REQUIRE(FormatSizeInfo(info.value()) == "329 x 483 mm");
    }

    {
        const auto info{ ParseSizeInfo("8,5 x 11 in") };
        REQUIRE(info.has_value());
        REQUIRE_THAT(info->m_Dimensions.x / 1_in, WithinAbs(8.5, 1e-3));
        REQUIRE_THAT(info->m_Dimensions.y / 1_in, WithinAbs(11.0, 1e-3));
        REQUIRE(info->m_BaseUnit == Unit::Inches);
        REQUIRE(info->m_Decimals == 1);
        REQUIRE(FormatSizeInfo(info.value()) == "8.5 x 11.0 inches");
    }

    REQUIRE(!ParseSizeInfo("").has_value());
    REQUIRE(!ParseSizeInfo("329 483 mm").has_value());
    REQUIRE(!ParseSizeInfo("329 x 483").has_value());
    REQUIRE(!ParseSizeInfo("329 x 483 furlong").has_value());
    REQUIRE(!ParseSizeInfo("wide x 483 mm").has_value());
    REQUIRE(!ParseSizeInfo("0 x 483 mm").has_value());
}

TEST_CASE("Length strings are parsed", "[config_parse_length]")
{
    {
        const auto info{ ParseLengthInfo("4 mm") };
        REQUIRE(info.has_value());
        REQUIRE_THAT(info->m_Dimension / 1_mm, WithinAbs(4.0, 1e-3));
        REQUIRE(FormatLengthInfo(info.value()) == "4 mm");
    }

    {
        const auto info{ ParseLengthInfo("0,25 in") };
        REQUIRE(info.has_value());
        REQUIRE_THAT(info->m_Dimension / 1_in, WithinAbs(0.25, 1e-3));
        REQUIRE(info->m_Decimals == 2);
    }

    REQUIRE(ParseLengthInfo("0 mm").has_value());
    REQUIRE(!ParseLengthInfo("-1 mm").has_value());
    REQUIRE(!ParseLengthInfo("4").has_value());
    REQUIRE(!ParseLengthInfo("4 mm extra").has_value());
}

TEST_CASE("Missing config falls back to defaults", "[config_missing]")
{
    LogCapture log;

    const TempDirectory root{ "config_missing" };
    const fs::path config_path{ root / "config.ini" };

    const Config config{ LoadConfig(config_path, false) };
    REQUIRE(!fs::exists(config_path));
    REQUIRE(config.m_DefaultPageSize == "A3+");
    REQUIRE(config.m_DefaultCardSize == "Standard");
    REQUIRE(config.m_Backend == PdfBackend::PoDoFo);
    REQUIRE(config.m_PageSizes.size() == Config::g_DefaultPageSizes.size());
    REQUIRE(config.m_CardSizes.size() == Config::g_DefaultCardSizes.size());

    const Config written{ LoadConfig(config_path, true) };
    REQUIRE(fs::exists(config_path));
}

TEST_CASE("Config survives a save and load", "[config_round_trip]")
{
    LogCapture log;

    const TempDirectory root{ "config_round_trip" };
    const fs::path config_path{ root / "config.ini" };

    Config config{};
    config.m_MaxWorkerThreads = 2;
    config.m_LogToFile = false;
    config.m_Backend = PdfBackend::Png;
    config.m_PdfImageFormat = ImageFormat::Png;
    config.m_PngCompression = 3;
    config.m_DefaultPageSize = "Tabloid";
    config.m_PageSizes["Tabloid"] = Config::SizeInfo{ { 11_in, 17_in }, Unit::Inches, 0u };
    config.m_CardSizes["Mini"] = Config::CardSizeInfo{
        .m_CardSize{ { 44_mm, 63_mm }, Unit::Millimeter, 0u },
        .m_BleedEdge{ 1_mm, Unit::Millimeter, 0u },
        .m_Hint{},
    };
    SaveConfig(config, config_path);
    REQUIRE(fs::exists(config_path));

    const Config loaded{ LoadConfig(config_path, false) };
    REQUIRE(loaded.m_MaxWorkerThreads == 2);
    REQUIRE(!loaded.m_LogToFile);
    REQUIRE(loaded.m_Backend == PdfBackend::Png);
    REQUIRE(loaded.m_PdfImageFormat == ImageFormat::Png);
    REQUIRE(loaded.m_PngCompression == 3);
    REQUIRE(!loaded.m_JpgQuality.has_value());
    REQUIRE(loaded.m_DefaultPageSize == "Tabloid");
    REQUIRE(loaded.m_PageSizes.contains("Tabloid"));
    REQUIRE_THAT(loaded.m_PageSizes.at("Tabloid").m_Dimensions.y / 1_in, WithinAbs(17.0, 1e-3));
    REQUIRE(loaded.m_CardSizes.contains("Mini"));
    REQUIRE_THAT(loaded.m_CardSizes.at("Mini").m_BleedEdge.m_Dimension / 1_mm, WithinAbs(1.0, 1e-3));
    REQUIRE(loaded.m_CardSizes.at("Standard").m_Hint == Config::g_DefaultCardSizes.at("Standard").m_Hint);
}

TEST_CASE("Unknown default sizes are reset", "[config_unknown_defaults]")
{
    LogCapture log;

    const TempDirectory root{ "config_unknown_defaults" };
    const fs::path config_path{ root / "config.ini" };
    WriteTextFile(config_path, "[DEFAULT]\nPage.Size=Papyrus\nCard.Size=Huge\nMax.Worker.Threads=0\n");

    const Config config{ LoadConfig(config_path, false) };
    REQUIRE(config.m_DefaultPageSize == "A3+");
    REQUIRE(config.m_DefaultCardSize == "Standard");
    REQUIRE(config.m_MaxWorkerThreads == 1);
}
