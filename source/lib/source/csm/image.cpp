#include <csm/image.hpp>

#include <array>
#include <bit>
#include <cstring>
#include <fstream>
#include <string_view>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace pngcrc
{
static uint32_t CRC(const uchar* buf, size_t len)
{
    static constexpr auto c_CrcTable{
        []()
        {
            std::array<uint32_t, 256> crc_table_bld{};
            for (uint32_t n = 0; n < 256; n++)
            {
                uint32_t c{ n };
                for (int32_t k = 0; k < 8; k++)
                {
                    c = (c & 1) ? 0xedb88320u ^ (c >> 1) : c >> 1;
                }
                crc_table_bld[n] = c;
            }
            return crc_table_bld;
        }()
    };

    uint32_t c{ 0xffffffffu };
    for (size_t n = 0; n < len; n++)
    {
        c = c_CrcTable[(c ^ buf[n]) & 0xff] ^ (c >> 8);
    }
    return c ^ 0xffffffffu;
}
} // namespace pngcrc

static bool WriteBuffer(const fs::path& path, const std::vector<uchar>& buf)
{
    std::ofstream file{ path, std::ios::binary | std::ios::trunc };
    if (!file)
    {
        return false;
    }
    file.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    return static_cast<bool>(file);
}

static std::vector<int> PngParams(std::optional<int32_t> compression)
{
    if (!compression.has_value())
    {
        return {};
    }
    return {
        cv::IMWRITE_PNG_COMPRESSION,
        compression.value(),
        cv::IMWRITE_PNG_STRATEGY,
        cv::IMWRITE_PNG_STRATEGY_DEFAULT,
    };
}

static std::vector<int> JpgParams(std::optional<int32_t> quality)
{
    if (!quality.has_value())
    {
        return {};
    }
    return {
        cv::IMWRITE_JPEG_QUALITY,
        quality.value(),
    };
}

static EncodedImage ToEncodedImage(const std::vector<uchar>& cv_buffer)
{
    EncodedImage out_buffer(cv_buffer.size(), std::byte{});
    std::memcpy(out_buffer.data(), cv_buffer.data(), cv_buffer.size());
    return out_buffer;
}

Image::Image(cv::Mat impl)
    : m_Impl{ std::move(impl) }
{
}

Image::Image(const Image& rhs)
    : m_Impl{ rhs.m_Impl.clone() }
{
}

Image& Image::operator=(const Image& rhs)
{
    m_Impl = rhs.m_Impl.clone();
    return *this;
}

Image Image::Filled(PixelSize size, ColorRGB8 color)
{
    const cv::Size cv_size{
        static_cast<int>(size.x / 1_pix),
        static_cast<int>(size.y / 1_pix),
    };
    return Image{ cv::Mat{ cv_size, CV_8UC3, cv::Scalar(color.b, color.g, color.r) } };
}

Image Image::Read(const fs::path& path)
{
    Image img{};
    img.m_Impl = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    return img;
}

bool Image::Write(const fs::path& path, std::optional<int32_t> png_compression, std::optional<int32_t> jpg_quality) const
{
    const std::string ext{ ToLower(path.extension().string()) };
    if (ext == ".png")
    {
        return cv::imwrite(path.string(), m_Impl, PngParams(png_compression));
    }
    else if (ext == ".jpg" || ext == ".jpeg")
    {
        return cv::imwrite(path.string(), m_Impl, JpgParams(jpg_quality));
    }
    return cv::imwrite(path.string(), m_Impl);
}

bool Image::Write(const fs::path& path, std::optional<int32_t> png_compression, std::optional<int32_t> jpg_quality, uint32_t dots_per_inch) const
{
    const std::string ext{ ToLower(path.extension().string()) };
    if (ext == ".png")
    {
        std::vector<uchar> buf;
        if (!cv::imencode(".png", m_Impl, buf, PngParams(png_compression)))
        {
            return false;
        }

        // Squeeze in a pHYs chunk before the first IDAT chunk
        size_t idat_idx{};
        for (size_t j = 4; j + 4 < buf.size(); j++)
        {
            if (std::string_view{ reinterpret_cast<const char*>(&buf[j]), 4 } == "IDAT")
            {
                idat_idx = j - 4;
                break;
            }
        }
        if (idat_idx == 0)
        {
            return false;
        }

        const auto dots_per_meter{ static_cast<uint32_t>(dots_per_inch / 0.0254 + 0.5) };

        // length + name + data + crc
        static constexpr size_t c_PhysDataSize{ 9 };
        std::array<uchar, 4 + 4 + c_PhysDataSize + 4> phys_buf{};
        const auto write_u32{
            [](uchar* dst, uint32_t value)
            {
                const uint32_t big_endian{ std::byteswap(value) };
                std::memcpy(dst, &big_endian, 4);
            }
        };
        write_u32(phys_buf.data(), c_PhysDataSize);
        std::memcpy(phys_buf.data() + 4, "pHYs", 4);
        write_u32(phys_buf.data() + 8, dots_per_meter);
        write_u32(phys_buf.data() + 12, dots_per_meter);
        phys_buf[16] = 1; // unit is meter
        write_u32(phys_buf.data() + 17, pngcrc::CRC(phys_buf.data() + 4, 4 + c_PhysDataSize));

        buf.insert(buf.begin() + static_cast<std::ptrdiff_t>(idat_idx), phys_buf.begin(), phys_buf.end());
        return WriteBuffer(path, buf);
    }
    else if (ext == ".jpg" || ext == ".jpeg")
    {
        std::vector<uchar> buf;
        if (!cv::imencode(".jpg", m_Impl, buf, JpgParams(jpg_quality)))
        {
            return false;
        }

        // Write the pixel density into the JFIF APP0 segment that OpenCV wrote
        const bool has_jfif_header{ buf.size() > 18 && buf[2] == 0xff && buf[3] == 0xe0 };
        if (has_jfif_header)
        {
            const auto dpi{ static_cast<uint16_t>(dots_per_inch) };
            buf[13] = 1; // 0: pixel ratio only, 1: dots per inch, 2: dots per cm
            buf[14] = static_cast<uchar>(dpi >> 8);
            buf[15] = static_cast<uchar>(dpi & 0xff);
            buf[16] = buf[14];
            buf[17] = buf[15];
        }
        return WriteBuffer(path, buf);
    }
    return Write(path, png_compression, jpg_quality);
}

EncodedImage Image::EncodePng(std::optional<int32_t> compression) const
{
    if (m_Impl.empty())
    {
        return {};
    }

    std::vector<uchar> cv_buffer;
    if (cv::imencode(".png", m_Impl, cv_buffer, PngParams(compression)))
    {
        return ToEncodedImage(cv_buffer);
    }
    return {};
}

EncodedImage Image::EncodeJpg(std::optional<int32_t> quality) const
{
    if (m_Impl.empty())
    {
        return {};
    }

    std::vector<uchar> cv_buffer;
    if (cv::imencode(".jpg", m_Impl, cv_buffer, JpgParams(quality)))
    {
        return ToEncodedImage(cv_buffer);
    }
    return {};
}

bool Image::Valid() const
{
    return !m_Impl.empty();
}

Image Image::ToBGR() const
{
    Image img{};
    switch (m_Impl.channels())
    {
    case 1:
        cv::cvtColor(m_Impl, img.m_Impl, cv::COLOR_GRAY2BGR);
        break;
    case 4:
        cv::cvtColor(m_Impl, img.m_Impl, cv::COLOR_BGRA2BGR);
        break;
    default:
        img.m_Impl = m_Impl;
        break;
    }

    // 16 bit inputs are brought down to 8 bit per channel
    if (img.m_Impl.depth() != CV_8U)
    {
        const double scale{ img.m_Impl.depth() == CV_16U ? 1.0 / 257.0 : 1.0 };
        img.m_Impl.convertTo(img.m_Impl, CV_8U, scale);
    }
    return img;
}

Image Image::Crop(Pixel left, Pixel top, Pixel right, Pixel bottom) const
{
    const int safe_left{ std::max(0, static_cast<int>(left / 1_pix)) };
    const int safe_top{ std::max(0, static_cast<int>(top / 1_pix)) };
    const int safe_right{ std::max(0, static_cast<int>(right / 1_pix)) };
    const int safe_bottom{ std::max(0, static_cast<int>(bottom / 1_pix)) };

    const int end_y{ m_Impl.rows - safe_bottom };
    const int end_x{ m_Impl.cols - safe_right };
    if (safe_top >= end_y || safe_left >= end_x)
    {
        return Image{};
    }

    Image img{};
    img.m_Impl = m_Impl(cv::Range(safe_top, end_y), cv::Range(safe_left, end_x)).clone();
    return img;
}

Image Image::AddBorder(Pixel left, Pixel top, Pixel right, Pixel bottom, ColorRGB8 color) const
{
    const int safe_left{ std::max(0, static_cast<int>(left / 1_pix)) };
    const int safe_top{ std::max(0, static_cast<int>(top / 1_pix)) };
    const int safe_right{ std::max(0, static_cast<int>(right / 1_pix)) };
    const int safe_bottom{ std::max(0, static_cast<int>(bottom / 1_pix)) };

    Image img{};
    cv::copyMakeBorder(m_Impl,
                       img.m_Impl,
                       safe_top,
                       safe_bottom,
                       safe_left,
                       safe_right,
                       cv::BORDER_CONSTANT,
                       cv::Scalar(color.b, color.g, color.r, 255));
    return img;
}

Image Image::AddBlackBorder(Pixel left, Pixel top, Pixel right, Pixel bottom) const
{
    return AddBorder(left, top, right, bottom, c_Black);
}

Image Image::Resize(PixelSize size) const
{
    Image img{};
    cv::resize(m_Impl,
               img.m_Impl,
               cv::Size(static_cast<int>(size.x / 1_pix), static_cast<int>(size.y / 1_pix)),
               0.0,
               0.0,
               cv::INTER_LANCZOS4);
    return img;
}

Pixel Image::Width() const
{
    return Size().x;
}

Pixel Image::Height() const
{
    return Size().y;
}

PixelSize Image::Size() const
{
    return PixelSize{
        Pixel(static_cast<float>(m_Impl.cols)),
        Pixel(static_cast<float>(m_Impl.rows)),
    };
}

int32_t Image::Channels() const
{
    return m_Impl.channels();
}

ColorRGB8 Image::PixelAt(int32_t x, int32_t y) const
{
    const auto& bgr{ m_Impl.at<cv::Vec3b>(y, x) };
    return ColorRGB8{ bgr[2], bgr[1], bgr[0] };
}

const cv::Mat& Image::GetUnderlying() const
{
    return m_Impl;
}
