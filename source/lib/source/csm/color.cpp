#include <csm/color.hpp>

#include <array>

#include <nlohmann/json.hpp>

nlohmann::json ColorToJson(const ColorRGB8& color)
{
    return nlohmann::json::array({ color.r, color.g, color.b });
}

std::optional<ColorRGB8> ColorFromJson(const nlohmann::json& json)
{
    if (!json.is_array() || json.size() != 3)
    {
        return std::nullopt;
    }

    std::array<uint8_t, 3> channels{};
    for (size_t i = 0; i < channels.size(); i++)
    {
        if (!json[i].is_number_integer())
        {
            return std::nullopt;
        }

        const auto channel{ json[i].get<int32_t>() };
        if (channel < 0 || channel > 255)
        {
            return std::nullopt;
        }
        channels[i] = static_cast<uint8_t>(channel);
    }
    return ColorRGB8{ channels[0], channels[1], channels[2] };
}
