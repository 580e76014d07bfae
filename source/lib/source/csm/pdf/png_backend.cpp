#include <csm/pdf/png_backend.hpp>

#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <csm/util/log.hpp>

void PngPage::DrawImage(const Image& canvas)
{
    m_Page = canvas;
}

PngDocument::PngDocument(const SheetDocumentOptions& options)
    : m_Options{ options }
{
}

PngPage* PngDocument::NextPage()
{
    std::lock_guard lock{ m_Mutex };
    m_Pages.push_back(std::make_unique<PngPage>());
    return m_Pages.back().get();
}

fs::path PngDocument::Write(fs::path path)
{
    std::lock_guard lock{ m_Mutex };

    const fs::path png_folder{ fs::path{ path }.replace_extension("") };
    std::error_code error;
    if (fs::exists(png_folder) && !fs::is_directory(png_folder))
    {
        fs::remove(png_folder, error);
    }
    fs::create_directories(png_folder, error);
    if (!fs::is_directory(png_folder))
    {
        throw std::logic_error{ fmt::format("Could not create folder {}", png_folder.string()) };
    }

    for (size_t i = 0; i < m_Pages.size(); i++)
    {
        const PngPage& page{ *m_Pages[i] };
        if (!page.m_Page.Valid())
        {
            continue;
        }

        const fs::path png_path{ png_folder / fs::path{ std::to_string(i) }.replace_extension(".png") };
        {
            const auto png_path_str{ png_path.string() };
            LogInfo("Saving to {}...", png_path_str);
        }

        if (!page.m_Page.Write(png_path, m_Options.m_PngCompression.value_or(5), std::nullopt, m_Options.m_DotsPerInch))
        {
            throw std::logic_error{ fmt::format("Failed writing {}", png_path.string()) };
        }
    }

    return png_folder;
}
