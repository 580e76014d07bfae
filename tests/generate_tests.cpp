#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <iterator>
#include <vector>

#include <log_capture.hpp>
#include <test_images.hpp>

#include <csm/config.hpp>
#include <csm/job/job.hpp>
#include <csm/layout/layout.hpp>
#include <csm/pdf/generate.hpp>

namespace
{
Job MakeTestJob(const TempDirectory& root)
{
    Job job{};
    job.m_Backface = root / "backface.png";
    job.m_NormalDir = root / "normal";
    job.m_DoubleFacedDir = root / "double";
    job.m_OutputDir = root / "output_sheets";
    job.m_DotsPerInch = 20;
    job.m_Deterministic = true;
    return job;
}

Config MakeTestConfig(PdfBackend backend)
{
    Config config{};
    config.m_Backend = backend;
    config.m_MaxWorkerThreads = 2;
    return config;
}

std::string ReadFileBytes(const fs::path& path)
{
    std::ifstream file{ path, std::ios::binary };
    return std::string{ std::istreambuf_iterator<char>{ file }, std::istreambuf_iterator<char>{} };
}

dla::ivec2 SlotCenter(const Layout& layout, uint32_t column, uint32_t row)
{
    const auto position{ layout.SlotPosition(column, row) };
    return dla::ivec2{
        position.x + layout.m_CardSizeWithBleed.x / 2,
        position.y + layout.m_CardSizeWithBleed.y / 2,
    };
}

void WriteCards(const TempDirectory& root, size_t num_normal_cards)
{
    REQUIRE(WriteSolidImage(root / "backface.png", 63, 88, c_TestGreen));
    for (size_t i = 0; i < num_normal_cards; i++)
    {
        REQUIRE(WriteSolidImage(root / "normal" / fmt::format("card_{:02}.png", i), 63, 88, c_TestRed));
    }
}
} // namespace

TEST_CASE("Sheet base names", "[generate_names]")
{
    REQUIRE(SheetBaseName("sheet", 0) == "sheet_01");
    REQUIRE(SheetBaseName("sheet", 9) == "sheet_10");
    REQUIRE(SheetBaseName("deck", 122) == "deck_123");
}

TEST_CASE("Sheets and cutting guides are written", "[generate_png]")
{
    LogCapture log;

    const TempDirectory root{ "generate_png" };
    WriteCards(root, 22);
    REQUIRE(WriteSolidImage(root / "double" / "dragon" / "a_front.png", 63, 88, c_TestRed));
    REQUIRE(WriteSolidImage(root / "double" / "dragon" / "b_back.png", 63, 88, c_TestGreen));

    const Job job{ MakeTestJob(root) };
    const GenerationResult result{ GenerateSheets(job, MakeTestConfig(PdfBackend::Png)) };

    REQUIRE(result.m_Status == GenerationStatus::Success);
    REQUIRE(result.m_NumCards == 23);
    REQUIRE(result.m_NumSheets == 2);
    REQUIRE(result.m_Failures.empty());
    REQUIRE(result.m_FallbackImages.empty());
    REQUIRE(result.m_Sheets.size() == 2);

    const fs::path output_dir{ root / "output_sheets" };
    for (size_t i = 0; i < 2; i++)
    {
        const SheetOutput& sheet{ result.m_Sheets[i] };
        const std::string base_name{ SheetBaseName("sheet", i) };
        REQUIRE(sheet.m_SheetIndex == i);

        // Front page first, then the back page
        REQUIRE(sheet.m_Document == output_dir / base_name);
        REQUIRE(fs::is_directory(sheet.m_Document));
        REQUIRE(fs::exists(sheet.m_Document / "0.png"));
        REQUIRE(fs::exists(sheet.m_Document / "1.png"));

        REQUIRE(sheet.m_CuttingGuide == output_dir / (base_name + "_cutting.jdf"));
        REQUIRE(fs::exists(sheet.m_CuttingGuide));
        REQUIRE(!sheet.m_CuttingGuideSvg.has_value());
    }

    // The double-faced card is the last card, alone on the second sheet in the first slot
    const Layout layout{ ComputeLayout(c_DefaultPhysicalConstants, c_DefaultCardGrid, 20) };
    const auto first_center{ SlotCenter(layout, 0, 0) };
    const auto mirrored_center{ SlotCenter(layout, 3, 0) };
    const auto second_center{ SlotCenter(layout, 1, 0) };

    const Image front{ Image::Read(output_dir / "sheet_02" / "0.png") };
    REQUIRE(front.Valid());
    REQUIRE(front.Width() == 259_pix);
    REQUIRE(front.Height() == 380_pix);
    REQUIRE(IsClose(front.PixelAt(first_center.x, first_center.y), c_TestRed));
    REQUIRE(front.PixelAt(mirrored_center.x, mirrored_center.y) == c_White);
    REQUIRE(front.PixelAt(second_center.x, second_center.y) == c_White);

    // Its back face lands in the mirrored column
    const Image back{ Image::Read(output_dir / "sheet_02" / "1.png") };
    REQUIRE(back.Valid());
    REQUIRE(IsClose(back.PixelAt(mirrored_center.x, mirrored_center.y), c_TestGreen));
    REQUIRE(back.PixelAt(first_center.x, first_center.y) == c_White);

    // The first sheet is full, its backs are the shared backface
    const Image first_back{ Image::Read(output_dir / "sheet_01" / "1.png") };
    REQUIRE(first_back.Valid());
    REQUIRE(IsClose(first_back.PixelAt(first_center.x, first_center.y), c_TestGreen));
    REQUIRE(IsClose(first_back.PixelAt(mirrored_center.x, mirrored_center.y), c_TestGreen));

    REQUIRE(log.Contains(Log::LogLevel::Information, "Will need 2 sheets"));
}

TEST_CASE("Repeated runs write identical output", "[generate_repeatable]")
{
    LogCapture log;

    const TempDirectory root{ "generate_repeatable" };
    WriteCards(root, 21);
    REQUIRE(WriteSolidImage(root / "double" / "dragon" / "a_front.png", 63, 88, c_TestRed));
    REQUIRE(WriteSolidImage(root / "double" / "dragon" / "b_back.png", 63, 88, c_TestGreen));

    const Job job{ MakeTestJob(root) };
    const fs::path output_dir{ root / "output_sheets" };
    const std::vector<fs::path> outputs{
        output_dir / "sheet_01_cutting.jdf",
        output_dir / "sheet_02_cutting.jdf",
        output_dir / "sheet_01" / "0.png",
        output_dir / "sheet_01" / "1.png",
        output_dir / "sheet_02" / "0.png",
        output_dir / "sheet_02" / "1.png",
    };

    const GenerationResult first_result{ GenerateSheets(job, MakeTestConfig(PdfBackend::Png)) };
    REQUIRE(first_result.m_Status == GenerationStatus::Success);
    REQUIRE(first_result.m_NumSheets == 2);

    std::vector<std::string> first_run;
    for (const fs::path& output : outputs)
    {
        REQUIRE(fs::exists(output));
        first_run.push_back(ReadFileBytes(output));
    }
    REQUIRE(first_run[0].find("<CutBlock") != std::string::npos);

    const GenerationResult second_result{ GenerateSheets(job, MakeTestConfig(PdfBackend::Png)) };
    REQUIRE(second_result.m_Status == GenerationStatus::Success);
    REQUIRE(second_result.m_NumSheets == 2);

    for (size_t i = 0; i < outputs.size(); i++)
    {
        INFO(outputs[i].string());
        REQUIRE(ReadFileBytes(outputs[i]) == first_run[i]);
    }
}

TEST_CASE("Svg cutting guides are written on request", "[generate_svg]")
{
    LogCapture log;

    const TempDirectory root{ "generate_svg" };
    WriteCards(root, 21);

    Job job{ MakeTestJob(root) };
    job.m_CuttingGuideSvg = true;
    const GenerationResult result{ GenerateSheets(job, MakeTestConfig(PdfBackend::Png)) };

    REQUIRE(result.m_Status == GenerationStatus::Success);
    REQUIRE(result.m_Sheets.size() == 2);
    for (const SheetOutput& sheet : result.m_Sheets)
    {
        const fs::path expected_path{ root / "output_sheets" / (SheetBaseName("sheet", sheet.m_SheetIndex) + "_cutting.svg") };
        REQUIRE(sheet.m_CuttingGuideSvg.has_value());
        REQUIRE(sheet.m_CuttingGuideSvg.value() == expected_path);
        REQUIRE(fs::exists(expected_path));
    }
}

TEST_CASE("Cards that fail to load are reported", "[generate_fallback]")
{
    LogCapture log;

    const TempDirectory root{ "generate_fallback" };
    WriteCards(root, 2);
    WriteTextFile(root / "normal" / "zz_broken.png", "not an image");

    const Job job{ MakeTestJob(root) };
    const GenerationResult result{ GenerateSheets(job, MakeTestConfig(PdfBackend::Png)) };

    REQUIRE(result.m_Status == GenerationStatus::Success);
    REQUIRE(result.m_NumCards == 3);
    REQUIRE(result.m_FallbackImages.size() == 1);
    REQUIRE(result.m_FallbackImages[0] == root / "normal" / "zz_broken.png");
}

TEST_CASE("Missing backface skips single backface cards", "[generate_missing_backface]")
{
    LogCapture log;

    const TempDirectory root{ "generate_missing_backface" };
    WriteCards(root, 3);
    fs::remove(root / "backface.png");
    REQUIRE(WriteSolidImage(root / "double" / "dragon" / "front.png", 63, 88, c_TestRed));
    REQUIRE(WriteSolidImage(root / "double" / "dragon" / "rear.png", 63, 88, c_TestGreen));

    const Job job{ MakeTestJob(root) };
    const GenerationResult result{ GenerateSheets(job, MakeTestConfig(PdfBackend::Png)) };

    REQUIRE(result.m_Status == GenerationStatus::Success);
    REQUIRE(result.m_NumCards == 1);
    REQUIRE(result.m_NumSheets == 1);
    REQUIRE(log.Contains(Log::LogLevel::Warning, "backface.png"));
}

TEST_CASE("Nothing is written without cards", "[generate_no_cards]")
{
    LogCapture log;

    const TempDirectory root{ "generate_no_cards" };

    const Job job{ MakeTestJob(root) };
    const GenerationResult result{ GenerateSheets(job, MakeTestConfig(PdfBackend::Png)) };

    REQUIRE(result.m_Status == GenerationStatus::NoCards);
    REQUIRE(result.m_NumCards == 0);
    REQUIRE(result.m_NumSheets == 0);
    REQUIRE(result.m_Sheets.empty());
    REQUIRE(!fs::exists(root / "output_sheets"));
    REQUIRE(log.Contains(Log::LogLevel::Error, "No cards found"));
}

TEST_CASE("Unwritable output is a partial failure", "[generate_unwritable]")
{
    LogCapture log;

    const TempDirectory root{ "generate_unwritable" };
    WriteCards(root, 3);
    WriteTextFile(root / "output_sheets", "a file where the folder should be");

    const Job job{ MakeTestJob(root) };
    const GenerationResult result{ GenerateSheets(job, MakeTestConfig(PdfBackend::Png)) };

    REQUIRE(result.m_Status == GenerationStatus::PartialFailure);
    REQUIRE(result.m_NumSheets == 1);
    REQUIRE(result.m_Sheets.empty());
    REQUIRE(result.m_Failures.size() == 1);
    REQUIRE(result.m_Failures[0].m_SheetIndex == 0);
    REQUIRE(log.Contains(Log::LogLevel::Error, "Failed writing sheet 1"));
}

TEST_CASE("Impossible layouts are rejected", "[generate_invalid_layout]")
{
    LogCapture log;

    const TempDirectory root{ "generate_invalid_layout" };
    WriteCards(root, 1);

    Job job{ MakeTestJob(root) };
    job.m_CardLayout = dla::uvec2{ 0, 5 };
    REQUIRE_THROWS_AS(GenerateSheets(job, MakeTestConfig(PdfBackend::Png)), std::invalid_argument);

    job.m_CardLayout = c_DefaultCardGrid;
    job.m_PageSize = "Papyrus";
    REQUIRE_THROWS_AS(GenerateSheets(job, MakeTestConfig(PdfBackend::Png)), std::invalid_argument);
}

TEST_CASE("Sheets are written as pdf", "[generate_pdf]")
{
    LogCapture log;

    const TempDirectory root{ "generate_pdf" };
    WriteCards(root, 4);

    Job job{ MakeTestJob(root) };
    job.m_FileName = "deck";
    const GenerationResult result{ GenerateSheets(job, MakeTestConfig(PdfBackend::PoDoFo)) };

    REQUIRE(result.m_Status == GenerationStatus::Success);
    REQUIRE(result.m_Sheets.size() == 1);

    const fs::path pdf_path{ root / "output_sheets" / "deck_01.pdf" };
    REQUIRE(result.m_Sheets[0].m_Document == pdf_path);
    REQUIRE(fs::exists(pdf_path));
    REQUIRE(fs::exists(root / "output_sheets" / "deck_01_cutting.jdf"));

    std::ifstream pdf_file{ pdf_path, std::ios::binary };
    std::string header(5, '\0');
    pdf_file.read(header.data(), 5);
    REQUIRE(header == "%PDF-");
}
