#include <csm/cutting/cutting_guide.hpp>

#include <stdexcept>

#include <QDateTime>
#include <QDomDocument>
#include <QFile>
#include <QTextStream>
#include <QTimeZone>

#include <fmt/format.h>

#include <csm/layout/layout.hpp>
#include <csm/layout/unit_converter.hpp>
#include <csm/qt_util.hpp>
#include <csm/util/log.hpp>

namespace
{
QString FormatMillimeters(double value)
{
    return ToQString(fmt::format("{:.3f}", value));
}

QString FormatPair(double first, double second)
{
    return ToQString(fmt::format("{:.3f} {:.3f}", first, second));
}

QString FormatTimestamp(std::time_t time)
{
    return QDateTime::fromSecsSinceEpoch(static_cast<qint64>(time), QTimeZone::utc())
        .toString(Qt::ISODate);
}
} // namespace

double CutRectangle::Width() const
{
    return m_Right - m_Left;
}

double CutRectangle::Height() const
{
    return m_Bottom - m_Top;
}

dla::tvec2<double> CutRectangle::Center() const
{
    return dla::tvec2<double>{ (m_Left + m_Right) / 2.0, (m_Top + m_Bottom) / 2.0 };
}

CuttingGuide BuildCuttingGuide(size_t sheet_index, const Layout& layout)
{
    const double dpi{ static_cast<double>(layout.m_DotsPerInch) };

    CuttingGuide guide{
        .m_SheetIndex = sheet_index,
        .m_PaperWidth = ToMillimeters(layout.m_Physical.m_PaperSize.x),
        .m_PaperHeight = ToMillimeters(layout.m_Physical.m_PaperSize.y),
        .m_CardWidth = ToMillimeters(layout.m_Physical.m_CardSize.x),
        .m_CardHeight = ToMillimeters(layout.m_Physical.m_CardSize.y),
        .m_Cuts = {},
    };
    guide.m_Cuts.reserve(layout.CardsPerSheet());

    const double half_width{ guide.m_CardWidth / 2.0 };
    const double half_height{ guide.m_CardHeight / 2.0 };
    for (uint32_t row = 0; row < layout.m_Grid.y; row++)
    {
        for (uint32_t column = 0; column < layout.m_Grid.x; column++)
        {
            const auto slot_position{ layout.SlotPosition(column, row) };
            const double center_x_pixels{ slot_position.x + layout.m_BleedEdge + layout.m_CardSize.x / 2.0 };
            const double center_y_pixels{ slot_position.y + layout.m_BleedEdge + layout.m_CardSize.y / 2.0 };
            const double center_x{ PixelsToMillimeters(center_x_pixels, dpi) };
            const double center_y{ PixelsToMillimeters(center_y_pixels, dpi) };

            guide.m_Cuts.push_back(CutRectangle{
                row,
                column,
                center_x - half_width,
                center_y - half_height,
                center_x + half_width,
                center_y + half_height,
            });
        }
    }

    return guide;
}

std::string CuttingJobId(size_t sheet_index)
{
    return fmt::format("Sheet_{:02}_Cutting", sheet_index + 1);
}

void WriteCuttingGuideJdf(const CuttingGuide& guide, const fs::path& path, const JdfOptions& options)
{
    static constexpr std::string_view c_MediaId{ "Media_001" };
    static constexpr std::string_view c_CuttingParamsId{ "CuttingParams_001" };
    static constexpr std::time_t c_JobDuration{ 30 * 60 };

    QDomDocument doc;
    doc.appendChild(doc.createProcessingInstruction("xml", R"(version="1.0" encoding="UTF-8")"));

    QDomElement jdf{ doc.createElement("JDF") };
    jdf.setAttribute("Type", "ProcessGroup");
    jdf.setAttribute("Types", "Cutting");
    jdf.setAttribute("ID", ToQString(CuttingJobId(guide.m_SheetIndex)));
    jdf.setAttribute("Status", "Waiting");
    jdf.setAttribute("Version", "1.3");
    if (!options.m_AgentName.empty())
    {
        jdf.setAttribute("AgentName", ToQString(options.m_AgentName));
        jdf.setAttribute("AgentVersion", ToQString(options.m_AgentVersion));
    }
    doc.appendChild(jdf);

    QDomElement resource_pool{ doc.createElement("ResourcePool") };
    jdf.appendChild(resource_pool);

    {
        QDomElement media{ doc.createElement("Media") };
        media.setAttribute("ID", ToQString(c_MediaId));
        media.setAttribute("Class", "Consumable");
        media.setAttribute("Status", "Available");
        media.setAttribute("MediaType", "Paper");
        media.setAttribute("Dimension", FormatPair(guide.m_PaperWidth, guide.m_PaperHeight));
        media.setAttribute("Unit", "mm");
        resource_pool.appendChild(media);
    }

    {
        QDomElement cutting_params{ doc.createElement("CuttingParams") };
        cutting_params.setAttribute("ID", ToQString(c_CuttingParamsId));
        cutting_params.setAttribute("Class", "Parameter");
        cutting_params.setAttribute("Status", "Available");
        resource_pool.appendChild(cutting_params);

        QDomElement cut_block{ doc.createElement("CutBlock") };
        cut_block.setAttribute("BlockName", "CardSheet");
        cut_block.setAttribute("TrimSize", FormatPair(guide.m_PaperWidth, guide.m_PaperHeight));
        cut_block.setAttribute("Unit", "mm");
        cutting_params.appendChild(cut_block);

        for (const CutRectangle& cut : guide.m_Cuts)
        {
            const auto center{ cut.Center() };

            QDomElement cut_mark{ doc.createElement("CutMark") };
            cut_mark.setAttribute("MarkType", "CutContour");
            cut_mark.setAttribute("Center", FormatPair(center.x, center.y));
            cut_mark.setAttribute("Size", FormatPair(cut.Width(), cut.Height()));
            cut_mark.setAttribute("Unit", "mm");
            cut_block.appendChild(cut_mark);

            QDomElement cut_path{ doc.createElement("CutPath") };
            cut_mark.appendChild(cut_path);

            // Coordinates are measured from the top edge, like the rendered sheet
            QDomElement rectangle{ doc.createElement("Rectangle") };
            rectangle.setAttribute("LLx", FormatMillimeters(cut.m_Left));
            rectangle.setAttribute("LLy", FormatMillimeters(cut.m_Top));
            rectangle.setAttribute("URx", FormatMillimeters(cut.m_Right));
            rectangle.setAttribute("URy", FormatMillimeters(cut.m_Bottom));
            rectangle.setAttribute("Unit", "mm");
            cut_path.appendChild(rectangle);
        }
    }

    {
        QDomElement node_info{ doc.createElement("NodeInfo") };
        node_info.setAttribute("NodeStatus", "Waiting");
        node_info.setAttribute("Start", FormatTimestamp(options.m_StartTime));
        node_info.setAttribute("End", FormatTimestamp(options.m_StartTime + c_JobDuration));
        jdf.appendChild(node_info);
    }

    {
        QDomElement resource_link_pool{ doc.createElement("ResourceLinkPool") };
        jdf.appendChild(resource_link_pool);

        QDomElement media_link{ doc.createElement("MediaLink") };
        media_link.setAttribute("Usage", "Input");
        media_link.setAttribute("rRef", ToQString(c_MediaId));
        resource_link_pool.appendChild(media_link);

        QDomElement cutting_link{ doc.createElement("CuttingParamsLink") };
        cutting_link.setAttribute("Usage", "Input");
        cutting_link.setAttribute("rRef", ToQString(c_CuttingParamsId));
        resource_link_pool.appendChild(cutting_link);
    }

    QFile file{ ToQString(path) };
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
    {
        throw std::runtime_error{ fmt::format("Could not open {} for writing", path.string()) };
    }

    QTextStream stream{ &file };
    doc.save(stream, 2);
    stream.flush();
    if (stream.status() != QTextStream::Ok)
    {
        throw std::runtime_error{ fmt::format("Failed writing cutting guide to {}", path.string()) };
    }

    LogInfo("Wrote cutting guide {} with {} cuts", path.string(), guide.m_Cuts.size());
}
