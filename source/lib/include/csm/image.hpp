#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <opencv2/core/mat.hpp>

#include <csm/color.hpp>
#include <csm/util.hpp>

using EncodedImage = std::vector<std::byte>;

class [[nodiscard]] Image
{
  public:
    Image() = default;
    Image(cv::Mat impl);
    ~Image() = default;

    Image(Image&& rhs) = default;
    Image(const Image& rhs);

    Image& operator=(Image&& rhs) = default;
    Image& operator=(const Image& rhs);

    // A three channel image of the given size filled with a solid color
    static Image Filled(PixelSize size, ColorRGB8 color);

    static Image Read(const fs::path& path);
    bool Write(const fs::path& path, std::optional<int32_t> png_compression = std::nullopt, std::optional<int32_t> jpg_quality = std::nullopt) const;
    // Additionally stores the resolution in the pHYs chunk of a png or the JFIF header of a jpg
    bool Write(const fs::path& path, std::optional<int32_t> png_compression, std::optional<int32_t> jpg_quality, uint32_t dots_per_inch) const;

    EncodedImage EncodePng(std::optional<int32_t> compression = std::nullopt) const;
    EncodedImage EncodeJpg(std::optional<int32_t> quality = std::nullopt) const;

    bool Valid() const;

    // Drops alpha, expands grayscale
    Image ToBGR() const;

    Image Crop(Pixel left, Pixel top, Pixel right, Pixel bottom) const;
    Image AddBorder(Pixel left, Pixel top, Pixel right, Pixel bottom, ColorRGB8 color) const;
    Image AddBlackBorder(Pixel left, Pixel top, Pixel right, Pixel bottom) const;

    // Lanczos resampling, meant for scaling card art
    Image Resize(PixelSize size) const;

    Pixel Width() const;
    Pixel Height() const;
    PixelSize Size() const;

    int32_t Channels() const;
    ColorRGB8 PixelAt(int32_t x, int32_t y) const;

    const cv::Mat& GetUnderlying() const;

  private:
    cv::Mat m_Impl{};
};
