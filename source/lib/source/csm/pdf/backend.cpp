#include <csm/pdf/backend.hpp>

#include <csm/pdf/png_backend.hpp>
#include <csm/pdf/podofo_backend.hpp>

std::unique_ptr<SheetDocument> CreateSheetDocument(PdfBackend backend, const SheetDocumentOptions& options)
{
    switch (backend)
    {
    case PdfBackend::PoDoFo:
        return std::make_unique<PoDoFoDocument>(options);
    case PdfBackend::Png:
        return std::make_unique<PngDocument>(options);
    default:
        return nullptr;
    }
}
