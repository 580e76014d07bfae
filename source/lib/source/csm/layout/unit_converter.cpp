#include <csm/layout/unit_converter.hpp>

#include <cmath>

int32_t MillimetersToPixels(double millimeters, double dots_per_inch)
{
    return static_cast<int32_t>(std::floor(millimeters * dots_per_inch / c_MillimetersPerInch));
}

int32_t ToPixels(Length length, uint32_t dots_per_inch)
{
    return MillimetersToPixels(ToMillimeters(length), static_cast<double>(dots_per_inch));
}

double PixelsToMillimeters(double pixels, double dots_per_inch)
{
    return pixels * c_MillimetersPerInch / dots_per_inch;
}

double ToMillimeters(Length length)
{
    return std::round(static_cast<double>(length / 1_mm) * 1000.0) / 1000.0;
}
