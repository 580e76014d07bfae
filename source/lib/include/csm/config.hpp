#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <csm/units.hpp>
#include <csm/util.hpp>

enum class PdfBackend
{
    PoDoFo,
    Png,
};

enum class ImageFormat
{
    Png,
    Jpg
};

/*
        Application wide settings, persisted in config.ini
        Settings that change from run to run live in Job instead
*/
struct Config
{
    uint32_t m_MaxWorkerThreads{ 4 };
    bool m_LogToFile{ true };
    PdfBackend m_Backend{ PdfBackend::PoDoFo };
    ImageFormat m_PdfImageFormat{ ImageFormat::Jpg };
    std::optional<int> m_PngCompression{ std::nullopt };
    std::optional<int> m_JpgQuality{ std::nullopt };
    std::string m_DefaultPageSize{ "A3+" };
    std::string m_DefaultCardSize{ "Standard" };

    // Strips creation dates and fixes timestamps so that output is byte-identical between runs
    bool m_DeterministicOutput{ false };

    struct SizeInfo
    {
        Size m_Dimensions;
        Unit m_BaseUnit;
        uint32_t m_Decimals;
    };
    struct LengthInfo
    {
        Length m_Dimension;
        Unit m_BaseUnit;
        uint32_t m_Decimals;
    };

    struct CardSizeInfo
    {
        SizeInfo m_CardSize;
        LengthInfo m_BleedEdge;
        std::string m_Hint;
    };

    inline static const std::map<std::string, SizeInfo> g_DefaultPageSizes{
        { "Letter", { { 8.5_in, 11_in }, Unit::Inches, 1u } },
        { "Legal", { { 8.5_in, 14_in }, Unit::Inches, 1u } },
        { "Ledger", { { 11_in, 17_in }, Unit::Inches, 1u } },
        { "A5", { { 148.5_mm, 210_mm }, Unit::Millimeter, 1u } },
        { "A4", { { 210_mm, 297_mm }, Unit::Millimeter, 0u } },
        { "A4+", { { 240_mm, 329_mm }, Unit::Millimeter, 0u } },
        { "A3", { { 297_mm, 420_mm }, Unit::Millimeter, 0u } },
        { "A3+", { { 329_mm, 483_mm }, Unit::Millimeter, 0u } },
    };
    std::map<std::string, SizeInfo> m_PageSizes{ g_DefaultPageSizes };

    inline static const std::map<std::string, CardSizeInfo> g_DefaultCardSizes{
        {
            "Standard",
            {
                .m_CardSize{ { 63_mm, 88_mm }, Unit::Millimeter, 0u },
                .m_BleedEdge{ 4_mm, Unit::Millimeter, 0u },
                .m_Hint{ "e.g. Magic the Gathering, Pokemon, and other TCGs" },
            },
        },
        {
            "Poker",
            {
                .m_CardSize{ { 2.5_in, 3.5_in }, Unit::Inches, 1u },
                .m_BleedEdge{ 3_mm, Unit::Millimeter, 0u },
                .m_Hint{},
            },
        },
        {
            "Japanese",
            {
                .m_CardSize{ { 59_mm, 86_mm }, Unit::Millimeter, 0u },
                .m_BleedEdge{ 2_mm, Unit::Millimeter, 0u },
                .m_Hint{ "e.g. Yu-Gi-Oh!" },
            },
        },
        {
            "Bridge",
            {
                .m_CardSize{ { 56_mm, 87_mm }, Unit::Millimeter, 0u },
                .m_BleedEdge{ 3_mm, Unit::Millimeter, 0u },
                .m_Hint{},
            },
        },
        {
            "Tarot",
            {
                .m_CardSize{ { 70_mm, 120_mm }, Unit::Millimeter, 0u },
                .m_BleedEdge{ 3_mm, Unit::Millimeter, 0u },
                .m_Hint{},
            },
        },
    };
    std::map<std::string, CardSizeInfo> m_CardSizes{ g_DefaultCardSizes };
};

// Parses "329 x 483 mm", a comma is accepted as decimal separator
std::optional<Config::SizeInfo> ParseSizeInfo(std::string str);
// Parses "4 mm"
std::optional<Config::LengthInfo> ParseLengthInfo(std::string str);

std::string FormatSizeInfo(const Config::SizeInfo& info);
std::string FormatLengthInfo(const Config::LengthInfo& info);

inline constexpr std::string_view c_DefaultConfigFile{ "config.ini" };

/*
        Reads the config from an ini file, missing keys keep their default
        If the file does not exist and write_default is set a default file is written
*/
Config LoadConfig(const fs::path& config_path = c_DefaultConfigFile, bool write_default = true);
void SaveConfig(const Config& config, const fs::path& config_path = c_DefaultConfigFile);

extern Config g_Cfg;
