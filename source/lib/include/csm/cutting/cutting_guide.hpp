#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include <dla/vector.h>

#include <csm/util.hpp>

struct Layout;

/*
        A trim rectangle in millimeters, measured from the top-left corner of the sheet
*/
struct CutRectangle
{
    uint32_t m_Row;
    uint32_t m_Column;

    double m_Left;
    double m_Top;
    double m_Right;
    double m_Bottom;

    double Width() const;
    double Height() const;
    dla::tvec2<double> Center() const;
};

struct CuttingGuide
{
    size_t m_SheetIndex;
    double m_PaperWidth;
    double m_PaperHeight;
    double m_CardWidth;
    double m_CardHeight;

    // One per grid cell, row by row
    std::vector<CutRectangle> m_Cuts;
};

/*
        Derives the cuts from the same pixel grid the sheet is rendered with,
        so a cut is centered exactly on the card printed in its slot
        The bleed is excluded, rectangles have the nominal card size
*/
CuttingGuide BuildCuttingGuide(size_t sheet_index, const Layout& layout);

struct JdfOptions
{
    std::string m_AgentName;
    std::string m_AgentVersion;
    // Start timestamp of the job, the end is 30 minutes later
    std::time_t m_StartTime;
};

// Sheet_NN_Cutting, NN being the 1-based sheet number
std::string CuttingJobId(size_t sheet_index);

// Throws std::runtime_error if the file can not be written
void WriteCuttingGuideJdf(const CuttingGuide& guide, const fs::path& path, const JdfOptions& options);

/*
        Paints the cuts through QSvgGenerator, so it must run on the thread of a QGuiApplication
        Throws std::runtime_error if there is none or the file can not be written
*/
void WriteCuttingGuideSvg(const CuttingGuide& guide, const fs::path& path);
