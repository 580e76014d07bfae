#pragma once

#include <cstdint>

#include <csm/util.hpp>

inline constexpr double c_MillimetersPerInch{ 25.4 };

/*
        Converts a physical length to a pixel count at the given resolution
        Always rounds down, i.e. floor(millimeters * dots_per_inch / 25.4)
*/
int32_t MillimetersToPixels(double millimeters, double dots_per_inch);
int32_t ToPixels(Length length, uint32_t dots_per_inch);

// Exact inverse without rounding
double PixelsToMillimeters(double pixels, double dots_per_inch);

// Length stores single precision meters, this snaps the value back to whole micrometers
double ToMillimeters(Length length);
