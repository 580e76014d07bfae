#pragma once

#include <cstdint>
#include <memory>

#include <csm/config.hpp>
#include <csm/image.hpp>
#include <csm/util.hpp>

class SheetDocument;

struct SheetDocumentOptions
{
    uint32_t m_DotsPerInch;
    ImageFormat m_ImageFormat{ ImageFormat::Jpg };
    std::optional<int32_t> m_PngCompression{ std::nullopt };
    std::optional<int32_t> m_JpgQuality{ std::nullopt };
    // Strips creation dates so that writing the same canvases twice gives identical files
    bool m_Deterministic{ false };
};

std::unique_ptr<SheetDocument> CreateSheetDocument(PdfBackend backend, const SheetDocumentOptions& options);

class SheetPage
{
  public:
    virtual ~SheetPage() = default;

    // Covers the whole page with the canvas, the page takes the physical size of the canvas
    virtual void DrawImage(const Image& canvas) = 0;

    virtual void Finish() = 0;
};

class SheetDocument
{
  public:
    virtual ~SheetDocument() = default;

    virtual SheetPage* NextPage() = 0;

    // Returns the path that was actually written, backends may adjust the extension
    // Throws std::logic_error if the document could not be written
    virtual fs::path Write(fs::path path) = 0;
};
