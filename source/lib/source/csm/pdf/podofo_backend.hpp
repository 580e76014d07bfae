#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <podofo/main/PdfImage.h>
#include <podofo/main/PdfMemDocument.h>
#include <podofo/main/PdfPainter.h>

#include <csm/pdf/backend.hpp>

class PoDoFoDocument;

class PoDoFoPage final : public SheetPage
{
    friend class PoDoFoDocument;

  public:
    virtual ~PoDoFoPage() override = default;

    virtual void DrawImage(const Image& canvas) override;

    virtual void Finish() override;

  private:
    PoDoFoPage(PoDoFoDocument* document);

    PoDoFoDocument* m_Document{ nullptr };
    PoDoFo::PdfPage* m_Page{ nullptr };
    std::unique_ptr<PoDoFo::PdfPainter> m_Painter;
    bool m_Finished{ false };
};

class PoDoFoDocument final : public SheetDocument
{
    friend class PoDoFoPage;

  public:
    PoDoFoDocument(const SheetDocumentOptions& options);
    virtual ~PoDoFoDocument() override = default;

    virtual PoDoFoPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

  private:
    auto AquireDocumentLock();

    std::unique_ptr<PoDoFo::PdfImage> MakeImage(const Image& canvas);

    mutable std::mutex m_Mutex;

    SheetDocumentOptions m_Options;

    PoDoFo::PdfMemDocument m_Document;
    std::vector<std::unique_ptr<PoDoFoPage>> m_Pages;
    std::vector<std::unique_ptr<PoDoFo::PdfImage>> m_Images;
};
