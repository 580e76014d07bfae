#pragma once

#include <string_view>

std::string_view CardSheetMakerVersion();
std::string_view CardSheetMakerBuildTime();

consteval std::string_view JobFormatVersion()
{
    return "CSM00001";
}
