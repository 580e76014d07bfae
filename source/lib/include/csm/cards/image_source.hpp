#pragma once

#include <array>
#include <vector>

#include <csm/util.hpp>

inline const std::array g_ValidImageExtensions{
    ".png"_p,
    ".jpg"_p,
    ".jpeg"_p,
    ".bmp"_p,
    ".tif"_p,
    ".tiff"_p,
    ".webp"_p,
};

/*
        Read-only view onto the place card images come from
        Listings return full paths in a deterministic order
*/
class ImageSource
{
  public:
    virtual ~ImageSource() = default;

    virtual bool Exists(const fs::path& path) const = 0;
    virtual bool IsDirectory(const fs::path& path) const = 0;

    // Image files directly inside root, sorted by file name
    virtual std::vector<fs::path> ListImages(const fs::path& root) const = 0;
    // Immediate sub-directories of root, sorted by name
    virtual std::vector<fs::path> ListFolders(const fs::path& root) const = 0;
};

class FilesystemImageSource final : public ImageSource
{
  public:
    virtual bool Exists(const fs::path& path) const override;
    virtual bool IsDirectory(const fs::path& path) const override;

    virtual std::vector<fs::path> ListImages(const fs::path& root) const override;
    virtual std::vector<fs::path> ListFolders(const fs::path& root) const override;
};
