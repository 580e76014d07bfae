#include <csm/pdf/podofo_backend.hpp>

#include <stdexcept>

#include <podofo/podofo.h>

#include <csm/util/log.hpp>

namespace
{
inline double ToPoDoFoPoints(int32_t pixels, uint32_t dots_per_inch)
{
    return static_cast<double>(pixels) * 72.0 / static_cast<double>(dots_per_inch);
}
} // namespace

auto PoDoFoDocument::AquireDocumentLock()
{
    return std::lock_guard{ m_Mutex };
}

PoDoFoPage::PoDoFoPage(PoDoFoDocument* document)
    : m_Document{ document }
    , m_Painter{ std::make_unique<PoDoFo::PdfPainter>() }
{
}

void PoDoFoPage::DrawImage(const Image& canvas)
{
    const auto dpi{ m_Document->m_Options.m_DotsPerInch };
    const auto canvas_width{ static_cast<int32_t>(canvas.Width() / 1_pix) };
    const auto canvas_height{ static_cast<int32_t>(canvas.Height() / 1_pix) };
    const auto real_w{ ToPoDoFoPoints(canvas_width, dpi) };
    const auto real_h{ ToPoDoFoPoints(canvas_height, dpi) };

    auto* image{ m_Document->MakeImage(canvas).release() };

    auto lock{ m_Document->AquireDocumentLock() };
    m_Document->m_Images.emplace_back(image);

    try
    {
        if (m_Page == nullptr)
        {
            auto& pages{ m_Document->m_Document.GetPages() };
            m_Page = &pages.CreatePageAt(pages.GetCount(), PoDoFo::Rect(0.0, 0.0, real_w, real_h));
            m_Painter->SetCanvas(*m_Page, PoDoFo::PdfPainterFlags::NoSaveRestorePrior);
        }

        const auto w_scale{ real_w / image->GetWidth() };
        const auto h_scale{ real_h / image->GetHeight() };
        m_Painter->DrawImage(*image, 0.0, 0.0, w_scale, h_scale);
    }
    catch (const PoDoFo::PdfError& e)
    {
        throw std::logic_error{ e.what() };
    }
}

void PoDoFoPage::Finish()
{
    if (m_Page != nullptr && !m_Finished)
    {
        auto lock{ m_Document->AquireDocumentLock() };
        try
        {
            m_Painter->FinishDrawing();
        }
        catch (const PoDoFo::PdfError& e)
        {
            throw std::logic_error{ e.what() };
        }
        m_Finished = true;
    }
}

PoDoFoDocument::PoDoFoDocument(const SheetDocumentOptions& options)
    : m_Options{ options }
{
}

PoDoFoPage* PoDoFoDocument::NextPage()
{
    auto lock{ AquireDocumentLock() };
    m_Pages.push_back(std::unique_ptr<PoDoFoPage>{ new PoDoFoPage{ this } });
    return m_Pages.back().get();
}

fs::path PoDoFoDocument::Write(fs::path path)
{
    try
    {
        for (auto& page : m_Pages)
        {
            page->Finish();
        }

        const auto pdf_path{ fs::path{ path }.replace_extension(".pdf") };
        const auto pdf_path_string{ pdf_path.string() };
        LogInfo("Saving to {}...", pdf_path_string);

        auto lock{ AquireDocumentLock() };

        if (m_Options.m_Deterministic)
        {
            auto& trailer{ m_Document.GetTrailer() };
            if (const auto* info{ trailer.GetDictionary().GetKey("Info") })
            {
                auto* obj{ m_Document.GetObjects().GetObject(info->GetReference()) };
                if (obj != nullptr)
                {
                    obj->GetDictionary().RemoveKey("CreationDate");
                }
            }

            m_Document.Save(pdf_path_string, PoDoFo::PdfSaveOptions::NoMetadataUpdate);
        }
        else
        {
            m_Document.Save(pdf_path_string);
        }

        return pdf_path;
    }
    catch (const PoDoFo::PdfError& e)
    {
        // Rethrow as a std::exception so the agnostic code can catch it
        throw std::logic_error{ e.what() };
    }
}

std::unique_ptr<PoDoFo::PdfImage> PoDoFoDocument::MakeImage(const Image& canvas)
{
    const auto encoded_image{
        m_Options.m_ImageFormat == ImageFormat::Png
            ? canvas.EncodePng(m_Options.m_PngCompression)
            : canvas.EncodeJpg(m_Options.m_JpgQuality),
    };
    if (encoded_image.empty())
    {
        throw std::logic_error{ "Failed encoding sheet canvas" };
    }

    try
    {
        std::unique_ptr<PoDoFo::PdfImage> podofo_image;
        {
            auto lock{ AquireDocumentLock() };
            podofo_image = m_Document.CreateImage();
        }
        podofo_image->LoadFromBuffer(
            PoDoFo::bufferview{
                reinterpret_cast<const char*>(encoded_image.data()),
                encoded_image.size(),
            });
        return podofo_image;
    }
    catch (const PoDoFo::PdfError& e)
    {
        throw std::logic_error{ e.what() };
    }
}
