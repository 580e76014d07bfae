#include <csm/cards/card_image.hpp>

#include <algorithm>
#include <cmath>

#include <csm/util/log.hpp>

namespace
{
PixelSize ToPixelSize(int32_t width, int32_t height)
{
    return PixelSize{
        Pixel(static_cast<float>(width)),
        Pixel(static_cast<float>(height)),
    };
}

Pixel ToPixel(int32_t value)
{
    return Pixel(static_cast<float>(value));
}

PreparedCard MakeFallback(const fs::path& image_path, dla::ivec2 card_size, int32_t bleed_edge, std::string reason)
{
    LogWarning("Using placeholder for {}: {}", image_path.string(), reason);
    return PreparedCard{
        MakeFallbackCard(card_size, bleed_edge),
        PrepareStatus::Fallback,
        std::move(reason),
    };
}
} // namespace

bool PreparedCard::IsFallback() const
{
    return m_Status == PrepareStatus::Fallback;
}

Image MakeFallbackCard(dla::ivec2 card_size, int32_t bleed_edge)
{
    const Image card_area{ Image::Filled(ToPixelSize(card_size.x, card_size.y), c_White) };
    const Pixel bleed{ ToPixel(bleed_edge) };
    return card_area.AddBlackBorder(bleed, bleed, bleed, bleed);
}

PreparedCard PrepareCard(const fs::path& image_path, dla::ivec2 card_size, int32_t bleed_edge)
{
    try
    {
        const Image loaded_image{ Image::Read(image_path) };
        if (!loaded_image.Valid())
        {
            return MakeFallback(image_path, card_size, bleed_edge, "image could not be decoded");
        }

        const Image source_image{ loaded_image.ToBGR() };
        const auto image_width{ static_cast<double>(source_image.Width() / 1_pix) };
        const auto image_height{ static_cast<double>(source_image.Height() / 1_pix) };

        // Scale so the image covers the card entirely, excess is cropped away afterwards
        const double scale{
            std::max(static_cast<double>(card_size.x) / image_width,
                     static_cast<double>(card_size.y) / image_height),
        };
        const int32_t scaled_width{ std::max(static_cast<int32_t>(image_width * scale), card_size.x) };
        const int32_t scaled_height{ std::max(static_cast<int32_t>(image_height * scale), card_size.y) };

        const Image scaled_image{
            source_image.Resize(ToPixelSize(scaled_width, scaled_height)),
        };

        const int32_t excess_x{ scaled_width - card_size.x };
        const int32_t excess_y{ scaled_height - card_size.y };
        const int32_t left{ excess_x / 2 };
        const int32_t top{ excess_y / 2 };
        const Image cropped_image{
            scaled_image.Crop(ToPixel(left), ToPixel(top), ToPixel(excess_x - left), ToPixel(excess_y - top)),
        };

        const Pixel bleed{ ToPixel(bleed_edge) };
        Image prepared_image{ cropped_image.AddBlackBorder(bleed, bleed, bleed, bleed) };
        if (!prepared_image.Valid())
        {
            return MakeFallback(image_path, card_size, bleed_edge, "image could not be cropped to card size");
        }

        return PreparedCard{
            std::move(prepared_image),
            PrepareStatus::Success,
            {},
        };
    }
    catch (const std::exception& e)
    {
        return MakeFallback(image_path, card_size, bleed_edge, e.what());
    }
}

PreparedCardCache::PreparedCardCache(std::span<const fs::path> shared_images)
    : m_SharedImages{ shared_images.begin(), shared_images.end() }
{
}

std::shared_ptr<const PreparedCard> PreparedCardCache::Get(const fs::path& image_path, dla::ivec2 card_size, int32_t bleed_edge)
{
    if (!IsShared(image_path))
    {
        return std::make_shared<const PreparedCard>(PrepareCard(image_path, card_size, bleed_edge));
    }

    const Key key{ image_path, card_size.x, card_size.y, bleed_edge };
    {
        std::lock_guard lock{ m_Mutex };
        if (auto it{ m_Cache.find(key) }; it != m_Cache.end())
        {
            return it->second;
        }
    }

    // Preparing outside the lock, two threads may race on the same image but only one result is kept
    auto prepared_card{ std::make_shared<const PreparedCard>(PrepareCard(image_path, card_size, bleed_edge)) };

    std::lock_guard lock{ m_Mutex };
    const auto [it, inserted]{ m_Cache.emplace(key, std::move(prepared_card)) };
    return it->second;
}

bool PreparedCardCache::IsShared(const fs::path& image_path) const
{
    return m_SharedImages.contains(image_path);
}

size_t PreparedCardCache::Size() const
{
    std::lock_guard lock{ m_Mutex };
    return m_Cache.size();
}
