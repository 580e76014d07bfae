#include <csm/pdf/generate.hpp>

#include <algorithm>
#include <ctime>
#include <mutex>
#include <stdexcept>

#include <QRunnable>
#include <QThreadPool>

#include <fmt/format.h>

#include <csm/cards/card_image.hpp>
#include <csm/cards/card_source.hpp>
#include <csm/cards/image_source.hpp>
#include <csm/config.hpp>
#include <csm/cutting/cutting_guide.hpp>
#include <csm/job/job.hpp>
#include <csm/layout/layout.hpp>
#include <csm/pdf/backend.hpp>
#include <csm/sheet/sheet_builder.hpp>
#include <csm/util/log.hpp>
#include <csm/version.hpp>

namespace
{
inline constexpr std::string_view c_AgentName{ "Card Sheet Maker" };

struct SheetContext
{
    const CardPairList& m_Cards;
    const Layout& m_Layout;
    const fs::path& m_OutputDir;
    std::string_view m_FileName;
    PdfBackend m_Backend;
    SheetDocumentOptions m_DocumentOptions;
    SheetOptions m_SheetOptions;
    JdfOptions m_JdfOptions;
    PreparedCardCache& m_CardCache;

    std::mutex m_ResultMutex;
    GenerationResult& m_Result;
};

SheetOutput GenerateSheet(SheetContext& context, size_t sheet_index)
{
    LogInfo("Making sheet {}...", sheet_index + 1);

    SheetBuildReport report{};
    const Image front{ BuildSheet(context.m_Cards, sheet_index, context.m_Layout, SheetSide::Front, context.m_CardCache, context.m_SheetOptions, &report) };
    const Image back{ BuildSheet(context.m_Cards, sheet_index, context.m_Layout, SheetSide::Back, context.m_CardCache, context.m_SheetOptions, &report) };

    if (!report.m_FallbackImages.empty())
    {
        std::lock_guard lock{ context.m_ResultMutex };
        auto& fallback_images{ context.m_Result.m_FallbackImages };
        fallback_images.insert(fallback_images.end(), report.m_FallbackImages.begin(), report.m_FallbackImages.end());
    }

    const auto base_name{ SheetBaseName(context.m_FileName, sheet_index) };

    auto document{ CreateSheetDocument(context.m_Backend, context.m_DocumentOptions) };
    if (document == nullptr)
    {
        throw std::logic_error{ "No document backend available" };
    }

    for (const Image* side : { &front, &back })
    {
        SheetPage* page{ document->NextPage() };
        page->DrawImage(*side);
        page->Finish();
    }

    SheetOutput output{};
    output.m_SheetIndex = sheet_index;
    output.m_Document = document->Write(context.m_OutputDir / fmt::format("{}.pdf", base_name));

    const CuttingGuide guide{ BuildCuttingGuide(sheet_index, context.m_Layout) };

    output.m_CuttingGuide = context.m_OutputDir / fmt::format("{}_cutting.jdf", base_name);
    WriteCuttingGuideJdf(guide, output.m_CuttingGuide, context.m_JdfOptions);

    return output;
}

// Painting runs on the calling thread, sheets whose svg fails are moved to the failures
void WriteSvgCuttingGuides(const Layout& layout, const fs::path& output_dir, std::string_view file_name, GenerationResult& result)
{
    std::erase_if(
        result.m_Sheets,
        [&](SheetOutput& output)
        {
            try
            {
                const CuttingGuide guide{ BuildCuttingGuide(output.m_SheetIndex, layout) };
                const auto base_name{ SheetBaseName(file_name, output.m_SheetIndex) };
                const fs::path svg_path{ output_dir / fmt::format("{}_cutting.svg", base_name) };
                WriteCuttingGuideSvg(guide, svg_path);
                output.m_CuttingGuideSvg = svg_path;
                return false;
            }
            catch (const std::exception& e)
            {
                LogError("Failed writing sheet {}: {}", output.m_SheetIndex + 1, e.what());
                result.m_Failures.push_back(SheetFailure{ output.m_SheetIndex, e.what() });
                return true;
            }
        });
}

class SheetWork : public QRunnable
{
  public:
    SheetWork(SheetContext& context, size_t sheet_index)
        : m_Context{ context }
        , m_SheetIndex{ sheet_index }
    {
        setAutoDelete(true);
    }

    virtual void run() override
    {
        try
        {
            SheetOutput output{ GenerateSheet(m_Context, m_SheetIndex) };

            std::lock_guard lock{ m_Context.m_ResultMutex };
            m_Context.m_Result.m_Sheets.push_back(std::move(output));
        }
        catch (const std::exception& e)
        {
            LogError("Failed writing sheet {}: {}", m_SheetIndex + 1, e.what());

            std::lock_guard lock{ m_Context.m_ResultMutex };
            m_Context.m_Result.m_Failures.push_back(SheetFailure{ m_SheetIndex, e.what() });
        }
    }

  private:
    SheetContext& m_Context;
    size_t m_SheetIndex;
};
} // namespace

std::string SheetBaseName(std::string_view file_name, size_t sheet_index)
{
    return fmt::format("{}_{:02}", file_name, sheet_index + 1);
}

GenerationResult GenerateSheets(const Job& job, const Config& config, const ImageSource& image_source)
{
    const Layout layout{ ComputeLayout(job.ToPhysicalConstants(config), job.m_CardLayout, job.m_DotsPerInch) };

    const CardPairList cards{ CollectCards(image_source, job.ToCardSources()) };

    GenerationResult result{};
    result.m_NumCards = cards.size();
    if (cards.empty())
    {
        LogError("No cards found! Check your folders.");
        result.m_Status = GenerationStatus::NoCards;
        return result;
    }

    LogInfo("Found {} cards", cards.size());

    std::error_code error;
    fs::create_directories(job.m_OutputDir, error);
    if (error)
    {
        LogError("Failed creating output folder {}: {}", job.m_OutputDir.string(), error.message());
    }

    result.m_NumSheets = ComputeSheetCount(cards.size(), layout.CardsPerSheet());
    LogInfo("Will need {} sheets", result.m_NumSheets);

    const bool deterministic{ job.m_Deterministic || config.m_DeterministicOutput };
    const std::vector<fs::path> shared_images{ FindSharedImages(cards) };
    PreparedCardCache card_cache{ shared_images };

    SheetContext context{
        .m_Cards = cards,
        .m_Layout = layout,
        .m_OutputDir = job.m_OutputDir,
        .m_FileName = job.m_FileName,
        .m_Backend = config.m_Backend,
        .m_DocumentOptions{
            .m_DotsPerInch = layout.m_DotsPerInch,
            .m_ImageFormat = config.m_PdfImageFormat,
            .m_PngCompression = config.m_PngCompression,
            .m_JpgQuality = config.m_JpgQuality,
            .m_Deterministic = deterministic,
        },
        .m_SheetOptions{
            .m_BackgroundColor = c_White,
            .m_BorderColor = job.m_BorderColor,
        },
        .m_JdfOptions{
            .m_AgentName{ std::string{ c_AgentName } },
            .m_AgentVersion{ std::string{ CardSheetMakerVersion() } },
            .m_StartTime = deterministic ? std::time_t{ 0 } : std::time(nullptr),
        },
        .m_CardCache = card_cache,
        .m_ResultMutex{},
        .m_Result = result,
    };

    {
        QThreadPool sheet_pool{};
        sheet_pool.setMaxThreadCount(static_cast<int>(std::max(config.m_MaxWorkerThreads, 1u)));
        for (size_t sheet_index = 0; sheet_index < result.m_NumSheets; sheet_index++)
        {
            sheet_pool.start(new SheetWork{ context, sheet_index });
        }
        sheet_pool.waitForDone();
    }

    std::ranges::sort(result.m_Sheets, {}, &SheetOutput::m_SheetIndex);
    if (job.m_CuttingGuideSvg)
    {
        WriteSvgCuttingGuides(layout, job.m_OutputDir, job.m_FileName, result);
    }
    std::ranges::sort(result.m_Failures, {}, &SheetFailure::m_SheetIndex);

    auto& fallback_images{ result.m_FallbackImages };
    std::ranges::sort(fallback_images);
    fallback_images.erase(std::unique(fallback_images.begin(), fallback_images.end()), fallback_images.end());

    result.m_Status = result.m_Failures.empty()
                          ? GenerationStatus::Success
                          : GenerationStatus::PartialFailure;
    if (result.m_Status == GenerationStatus::Success)
    {
        LogInfo("All done! Check the {} folder.", job.m_OutputDir.string());
    }
    else
    {
        LogWarning("{} of {} sheets failed", result.m_Failures.size(), result.m_NumSheets);
    }

    return result;
}

GenerationResult GenerateSheets(const Job& job, const Config& config)
{
    const FilesystemImageSource image_source{};
    return GenerateSheets(job, config, image_source);
}
