#include <csm/job/job.hpp>

#include <fstream>
#include <stdexcept>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <csm/config.hpp>
#include <csm/json_util.hpp>
#include <csm/util/log.hpp>
#include <csm/version.hpp>

namespace
{
nlohmann::json SizeToJson(const Size& size)
{
    return nlohmann::json{
        { "width", size.x / 1_mm },
        { "height", size.y / 1_mm },
    };
}

Size SizeFromJson(const nlohmann::json& json)
{
    return Size{
        json.at("width").get<float>() * 1_mm,
        json.at("height").get<float>() * 1_mm,
    };
}

// Sizes are either given by name or as an object with width and height in millimeters
void ReadSizeChoice(const nlohmann::json& json, std::string& name, std::optional<Size>& custom)
{
    if (json.is_string())
    {
        name = json.get<std::string>();
        custom = std::nullopt;
    }
    else if (json.is_object())
    {
        name.clear();
        custom = SizeFromJson(json);
    }
    else if (!json.is_null())
    {
        throw std::logic_error{ fmt::format("Expected a size name or object, got {}", json.dump()) };
    }
}

nlohmann::json WriteSizeChoice(const std::string& name, const std::optional<Size>& custom)
{
    if (custom.has_value())
    {
        return SizeToJson(custom.value());
    }
    if (name.empty())
    {
        return nullptr;
    }
    return name;
}
} // namespace

bool Job::Load(const fs::path& json_path, const JsonProvider* overrides)
{
    std::ifstream file{ json_path };
    if (!file)
    {
        LogError("Failed opening job file {}", json_path.string());
        return false;
    }

    const std::string json_blob{ std::istreambuf_iterator<char>{ file }, std::istreambuf_iterator<char>{} };
    LogInfo("Loading job from {}...", json_path.string());
    return LoadFromJson(json_blob, overrides);
}

bool Job::LoadFromJson(std::string_view json_blob, const JsonProvider* overrides)
{
    Job job{};

    try
    {
        nlohmann::json json = nlohmann::json::parse(json_blob);
        if (!json.is_object())
        {
            throw std::logic_error{ "Job json has to be an object..." };
        }

        if (overrides != nullptr)
        {
            ApplyJsonOverrides(json, *overrides);
        }

        if (json.contains("version") && (!json["version"].is_string() || json["version"].get_ref<const std::string&>() != JobFormatVersion()))
        {
            throw std::logic_error{ "Job version not compatible with App version..." };
        }

        if (json.contains("backface"))
        {
            job.m_Backface = json["backface"].get<std::string>();
        }
        if (json.contains("normal_dir"))
        {
            job.m_NormalDir = json["normal_dir"].get<std::string>();
        }
        if (json.contains("double_dir"))
        {
            job.m_DoubleFacedDir = json["double_dir"].get<std::string>();
        }
        if (json.contains("output_dir"))
        {
            job.m_OutputDir = json["output_dir"].get<std::string>();
        }
        if (json.contains("file_name"))
        {
            job.m_FileName = json["file_name"].get<std::string>();
        }

        if (json.contains("paper_size"))
        {
            ReadSizeChoice(json["paper_size"], job.m_PageSize, job.m_CustomPageSize);
        }
        if (json.contains("card_size"))
        {
            ReadSizeChoice(json["card_size"], job.m_CardSize, job.m_CustomCardSize);
        }
        if (json.contains("bleed_edge") && !json["bleed_edge"].is_null())
        {
            job.m_BleedEdge = json["bleed_edge"].get<float>() * 1_mm;
        }

        if (json.contains("card_layout"))
        {
            const auto& card_layout{ json["card_layout"] };
            if (card_layout.contains("width"))
            {
                job.m_CardLayout.x = card_layout["width"].get<uint32_t>();
            }
            if (card_layout.contains("height"))
            {
                job.m_CardLayout.y = card_layout["height"].get<uint32_t>();
            }
        }
        if (json.contains("dpi"))
        {
            job.m_DotsPerInch = json["dpi"].get<uint32_t>();
        }

        if (json.contains("border_color"))
        {
            const auto border_color{ ColorFromJson(json["border_color"]) };
            if (!border_color.has_value())
            {
                throw std::logic_error{ fmt::format("Invalid border_color {}", json["border_color"].dump()) };
            }
            job.m_BorderColor = border_color.value();
        }

        if (json.contains("cutting_guide_svg"))
        {
            job.m_CuttingGuideSvg = json["cutting_guide_svg"].get<bool>();
        }
        if (json.contains("deterministic"))
        {
            job.m_Deterministic = json["deterministic"].get<bool>();
        }
    }
    catch (const std::exception& e)
    {
        LogError("Failed loading job: {}", e.what());
        return false;
    }

    *this = std::move(job);
    return true;
}

void Job::Dump(const fs::path& json_path) const
{
    if (std::ofstream file{ json_path })
    {
        LogInfo("Writing job to {}...", json_path.string());
        file << DumpToJson();
    }
    else
    {
        LogError("Failed opening {} for writing", json_path.string());
    }
}

std::string Job::DumpToJson() const
{
    nlohmann::json json{};
    json["version"] = JobFormatVersion();

    json["backface"] = m_Backface.string();
    json["normal_dir"] = m_NormalDir.string();
    json["double_dir"] = m_DoubleFacedDir.string();
    json["output_dir"] = m_OutputDir.string();
    json["file_name"] = m_FileName;

    json["paper_size"] = WriteSizeChoice(m_PageSize, m_CustomPageSize);
    json["card_size"] = WriteSizeChoice(m_CardSize, m_CustomCardSize);
    if (m_BleedEdge.has_value())
    {
        json["bleed_edge"] = m_BleedEdge.value() / 1_mm;
    }
    else
    {
        json["bleed_edge"] = nullptr;
    }

    json["card_layout"] = nlohmann::json{
        { "width", m_CardLayout.x },
        { "height", m_CardLayout.y },
    };
    json["dpi"] = m_DotsPerInch;

    json["border_color"] = ColorToJson(m_BorderColor);
    json["cutting_guide_svg"] = m_CuttingGuideSvg;
    json["deterministic"] = m_Deterministic;

    return json.dump(4);
}

PhysicalConstants Job::ToPhysicalConstants(const Config& config) const
{
    PhysicalConstants physical{};

    if (m_CustomPageSize.has_value())
    {
        physical.m_PaperSize = m_CustomPageSize.value();
    }
    else
    {
        const auto& page_size_name{ m_PageSize.empty() ? config.m_DefaultPageSize : m_PageSize };
        if (!config.m_PageSizes.contains(page_size_name))
        {
            throw std::invalid_argument{ fmt::format("Unknown paper size {}", page_size_name) };
        }
        physical.m_PaperSize = config.m_PageSizes.at(page_size_name).m_Dimensions;
    }

    const auto& card_size_name{ m_CardSize.empty() ? config.m_DefaultCardSize : m_CardSize };
    const auto card_size_it{ config.m_CardSizes.find(card_size_name) };
    if (m_CustomCardSize.has_value())
    {
        physical.m_CardSize = m_CustomCardSize.value();
    }
    else if (card_size_it != config.m_CardSizes.end())
    {
        physical.m_CardSize = card_size_it->second.m_CardSize.m_Dimensions;
    }
    else
    {
        throw std::invalid_argument{ fmt::format("Unknown card size {}", card_size_name) };
    }

    if (m_BleedEdge.has_value())
    {
        physical.m_BleedEdge = m_BleedEdge.value();
    }
    else if (!m_CustomCardSize.has_value() && card_size_it != config.m_CardSizes.end())
    {
        physical.m_BleedEdge = card_size_it->second.m_BleedEdge.m_Dimension;
    }
    else
    {
        physical.m_BleedEdge = c_DefaultPhysicalConstants.m_BleedEdge;
    }

    return physical;
}

CardSources Job::ToCardSources() const
{
    return CardSources{
        .m_Backface = m_Backface,
        .m_NormalDir = m_NormalDir,
        .m_DoubleFacedDir = m_DoubleFacedDir,
    };
}
