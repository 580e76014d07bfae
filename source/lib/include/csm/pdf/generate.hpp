#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <csm/util.hpp>

struct Config;
struct Job;
class ImageSource;

enum class GenerationStatus
{
    Success,
    // Some sheets could not be written, the others are complete
    PartialFailure,
    // Nothing to lay out, no output was written
    NoCards,
};

struct SheetOutput
{
    size_t m_SheetIndex;
    fs::path m_Document;
    fs::path m_CuttingGuide;
    std::optional<fs::path> m_CuttingGuideSvg;
};

struct SheetFailure
{
    size_t m_SheetIndex;
    std::string m_Reason;
};

struct GenerationResult
{
    GenerationStatus m_Status{ GenerationStatus::NoCards };
    size_t m_NumCards{ 0 };
    size_t m_NumSheets{ 0 };

    // Both sorted by sheet index
    std::vector<SheetOutput> m_Sheets;
    std::vector<SheetFailure> m_Failures;

    // Images that were replaced by a placeholder, sorted and unique
    std::vector<fs::path> m_FallbackImages;
};

// <file_name>_NN with NN the 1-based sheet number, padded to at least two digits
std::string SheetBaseName(std::string_view file_name, size_t sheet_index);

/*
        Renders front and back of every sheet into one document per sheet and writes
        a cutting guide next to it
        Throws std::invalid_argument if the job describes an impossible layout
*/
GenerationResult GenerateSheets(const Job& job, const Config& config, const ImageSource& image_source);
GenerationResult GenerateSheets(const Job& job, const Config& config);
