#include <csm/cutting/cutting_guide.hpp>

#include <cmath>
#include <stdexcept>

#include <QGuiApplication>
#include <QPainter>
#include <QPen>
#include <QRectF>
#include <QSvgGenerator>

#include <fmt/format.h>

#include <csm/qt_util.hpp>
#include <csm/util/log.hpp>

namespace
{
// The generator works in pixels, this puts ten of them into every millimeter
inline constexpr int c_SvgDotsPerInch{ 254 };
inline constexpr double c_SvgPixelsPerMillimeter{ c_SvgDotsPerInch / 25.4 };

QRectF CutToRect(const CutRectangle& cut)
{
    return QRectF{
        cut.m_Left,
        cut.m_Top,
        cut.Width(),
        cut.Height(),
    };
}
} // namespace

void WriteCuttingGuideSvg(const CuttingGuide& guide, const fs::path& path)
{
    if (qobject_cast<QGuiApplication*>(QCoreApplication::instance()) == nullptr)
    {
        throw std::runtime_error{ "Writing svg cutting guides requires a QGuiApplication" };
    }

    const QSize svg_size{
        static_cast<int>(std::lround(guide.m_PaperWidth * c_SvgPixelsPerMillimeter)),
        static_cast<int>(std::lround(guide.m_PaperHeight * c_SvgPixelsPerMillimeter)),
    };

    QSvgGenerator generator{};
    generator.setFileName(ToQString(path));
    generator.setResolution(c_SvgDotsPerInch);
    generator.setSize(svg_size);
    generator.setViewBox(QRectF{ 0.0, 0.0, guide.m_PaperWidth, guide.m_PaperHeight });
    generator.setTitle(ToQString(CuttingJobId(guide.m_SheetIndex)));
    generator.setDescription("Cutting guides for the accompanying sheet, in millimeters.");

    QPainter painter;
    if (!painter.begin(&generator))
    {
        throw std::runtime_error{ fmt::format("Could not open {} for writing", path.string()) };
    }

    QPen pen{};
    pen.setWidthF(0.1);
    pen.setColor(Qt::red);
    painter.setPen(pen);
    painter.setRenderHint(QPainter::RenderHint::Antialiasing, true);
    for (const CutRectangle& cut : guide.m_Cuts)
    {
        painter.drawRect(CutToRect(cut));
    }
    painter.end();

    if (!fs::exists(path))
    {
        throw std::runtime_error{ fmt::format("Failed writing cutting guide to {}", path.string()) };
    }

    LogInfo("Wrote svg cutting guide {}", path.string());
}
