#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <csm/image.hpp>

#include <csm/pdf/backend.hpp>

class PngDocument;

class PngPage final : public SheetPage
{
    friend class PngDocument;

  public:
    virtual ~PngPage() override = default;

    virtual void DrawImage(const Image& canvas) override;

    virtual void Finish() override{};

  private:
    Image m_Page{};
};

/*
        Writes every page as a png into a folder named after the document,
        useful for checking output without a pdf viewer
*/
class PngDocument final : public SheetDocument
{
  public:
    PngDocument(const SheetDocumentOptions& options);
    virtual ~PngDocument() override = default;

    virtual PngPage* NextPage() override;

    virtual fs::path Write(fs::path path) override;

  private:
    mutable std::mutex m_Mutex;

    SheetDocumentOptions m_Options;

    std::vector<std::unique_ptr<PngPage>> m_Pages;
};
