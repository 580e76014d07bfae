#include <csm/config.hpp>

#include <algorithm>
#include <charconv>
#include <ranges>
#include <string>
#include <vector>

#include <QFile>
#include <QSettings>
#include <QStringList>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <csm/qt_util.hpp>
#include <csm/util/log.hpp>

Config g_Cfg{};

namespace
{
std::vector<std::string_view> SplitWords(std::string_view str)
{
    std::vector<std::string_view> words;
    for (auto word : str | std::views::split(' '))
    {
        if (!word.empty())
        {
            words.emplace_back(word.begin(), word.end());
        }
    }
    return words;
}

std::optional<float> ToFloat(std::string_view str)
{
    float val{};
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), val) };
    if (ec != std::errc{} || ptr != str.data() + str.size())
    {
        return std::nullopt;
    }
    return val;
}

uint32_t GetDecimals(std::string_view str)
{
    const auto dot{ str.find('.') };
    if (dot == std::string_view::npos)
    {
        return 0;
    }
    return static_cast<uint32_t>(str.size() - dot - 1);
}
} // namespace

std::optional<Config::SizeInfo> ParseSizeInfo(std::string str)
{
    std::ranges::replace(str, ',', '.');

    const auto parts{ SplitWords(str) };
    if (parts.size() != 4 || parts[1] != "x")
    {
        return std::nullopt;
    }

    const auto base_unit{ UnitFromName(parts[3]) };
    const auto width{ ToFloat(parts[0]) };
    const auto height{ ToFloat(parts[2]) };
    if (!base_unit || !width || !height || width.value() <= 0.0f || height.value() <= 0.0f)
    {
        return std::nullopt;
    }

    const auto unit_value{ UnitValue(base_unit.value()) };
    return Config::SizeInfo{
        { width.value() * unit_value, height.value() * unit_value },
        base_unit.value(),
        std::max(GetDecimals(parts[0]), GetDecimals(parts[2])),
    };
}

std::optional<Config::LengthInfo> ParseLengthInfo(std::string str)
{
    std::ranges::replace(str, ',', '.');

    const auto parts{ SplitWords(str) };
    if (parts.size() != 2)
    {
        return std::nullopt;
    }

    const auto base_unit{ UnitFromName(parts[1]) };
    const auto length{ ToFloat(parts[0]) };
    if (!base_unit || !length || length.value() < 0.0f)
    {
        return std::nullopt;
    }

    return Config::LengthInfo{
        length.value() * UnitValue(base_unit.value()),
        base_unit.value(),
        GetDecimals(parts[0]),
    };
}

std::string FormatSizeInfo(const Config::SizeInfo& info)
{
    const auto& [size, base_unit, decimals]{ info };
    const auto unit_value{ UnitValue(base_unit) };
    return fmt::format("{0:.{2}f} x {1:.{2}f} {3}",
                       size.x / unit_value,
                       size.y / unit_value,
                       decimals,
                       UnitName(base_unit));
}

std::string FormatLengthInfo(const Config::LengthInfo& info)
{
    const auto& [length, base_unit, decimals]{ info };
    return fmt::format("{0:.{1}f} {2}", length / UnitValue(base_unit), decimals, UnitName(base_unit));
}

Config LoadConfig(const fs::path& config_path, bool write_default)
{
    Config config{};
    if (!QFile::exists(ToQString(config_path)))
    {
        if (write_default)
        {
            SaveConfig(config, config_path);
        }
        return config;
    }

    QSettings settings(ToQString(config_path), QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        LogError("Failed reading config from {}, using defaults...", config_path.string());
        return config;
    }

    {
        settings.beginGroup("DEFAULT");

        config.m_MaxWorkerThreads = static_cast<uint32_t>(std::max(settings.value("Max.Worker.Threads", 4).toInt(), 1));
        config.m_LogToFile = settings.value("Log.File", true).toBool();
        config.m_DefaultPageSize = settings.value("Page.Size", "A3+").toString().toStdString();
        config.m_DefaultCardSize = settings.value("Card.Size", "Standard").toString().toStdString();

        {
            const auto pdf_backend{ settings.value("PDF.Backend", "PoDoFo").toString().toStdString() };
            config.m_Backend = magic_enum::enum_cast<PdfBackend>(pdf_backend)
                                   .value_or(PdfBackend::PoDoFo);
        }

        {
            const auto pdf_image_format{ settings.value("PDF.Backend.Image.Format", "Jpg").toString().toStdString() };
            config.m_PdfImageFormat = magic_enum::enum_cast<ImageFormat>(pdf_image_format)
                                          .value_or(ImageFormat::Jpg);
        }

        {
            const auto png_compression{ settings.value("PDF.Backend.Png.Compression") };
            if (png_compression.isValid())
            {
                config.m_PngCompression = std::clamp(png_compression.toInt(), 0, 9);
            }
        }

        {
            const auto jpg_quality{ settings.value("PDF.Backend.Jpg.Quality") };
            if (jpg_quality.isValid())
            {
                config.m_JpgQuality = std::clamp(jpg_quality.toInt(), 0, 100);
            }
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("PAGE_SIZES");

        for (const auto& key : settings.allKeys())
        {
            if (auto info{ ParseSizeInfo(settings.value(key).toString().toStdString()) })
            {
                config.m_PageSizes[key.toStdString()] = std::move(info).value();
            }
            else
            {
                LogWarning("Ignoring malformed page size {}", key.toStdString());
            }
        }

        settings.endGroup();
    }

    for (const QString& group : settings.childGroups())
    {
        if (group.startsWith("CARD_SIZE") && group.indexOf("-") != -1)
        {
            settings.beginGroup(group);

            const auto card_size{ ParseSizeInfo(settings.value("Card.Size").toString().toStdString()) };
            const auto bleed_edge{ ParseLengthInfo(settings.value("Bleed").toString().toStdString()) };
            if (card_size && bleed_edge)
            {
                const auto card_size_name{ group.sliced(group.indexOf("-") + 1).trimmed().toStdString() };
                config.m_CardSizes[card_size_name] = Config::CardSizeInfo{
                    card_size.value(),
                    bleed_edge.value(),
                    settings.value("Hint").toString().toStdString(),
                };
            }
            else
            {
                LogWarning("Ignoring malformed card size {}", group.toStdString());
            }

            settings.endGroup();
        }
    }

    if (!config.m_PageSizes.contains(config.m_DefaultPageSize))
    {
        config.m_DefaultPageSize = "A3+";
    }
    if (!config.m_CardSizes.contains(config.m_DefaultCardSize))
    {
        config.m_DefaultCardSize = "Standard";
    }

    return config;
}

void SaveConfig(const Config& config, const fs::path& config_path)
{
    QSettings settings(ToQString(config_path), QSettings::IniFormat);
    if (settings.status() != QSettings::Status::NoError)
    {
        LogError("Failed writing config to {}...", config_path.string());
        return;
    }

    {
        settings.beginGroup("DEFAULT");

        settings.setValue("Max.Worker.Threads", config.m_MaxWorkerThreads);
        settings.setValue("Log.File", config.m_LogToFile);
        settings.setValue("Page.Size", ToQString(config.m_DefaultPageSize));
        settings.setValue("Card.Size", ToQString(config.m_DefaultCardSize));
        settings.setValue("PDF.Backend", ToQString(magic_enum::enum_name(config.m_Backend)));
        settings.setValue("PDF.Backend.Image.Format", ToQString(magic_enum::enum_name(config.m_PdfImageFormat)));

        if (config.m_PngCompression.has_value())
        {
            settings.setValue("PDF.Backend.Png.Compression", config.m_PngCompression.value());
        }

        if (config.m_JpgQuality.has_value())
        {
            settings.setValue("PDF.Backend.Jpg.Quality", config.m_JpgQuality.value());
        }

        settings.endGroup();
    }

    {
        settings.beginGroup("PAGE_SIZES");

        for (const auto& [name, info] : config.m_PageSizes)
        {
            settings.setValue(ToQString(name), ToQString(FormatSizeInfo(info)));
        }

        settings.endGroup();
    }

    for (const auto& [card_name, card_size_info] : config.m_CardSizes)
    {
        settings.beginGroup(ToQString("CARD_SIZE - " + card_name));
        settings.setValue("Card.Size", ToQString(FormatSizeInfo(card_size_info.m_CardSize)));
        settings.setValue("Bleed", ToQString(FormatLengthInfo(card_size_info.m_BleedEdge)));
        if (!card_size_info.m_Hint.empty())
        {
            settings.setValue("Hint", ToQString(card_size_info.m_Hint));
        }
        settings.endGroup();
    }

    settings.sync();
}
