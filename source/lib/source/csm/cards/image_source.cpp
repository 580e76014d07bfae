#include <csm/cards/image_source.hpp>

bool FilesystemImageSource::Exists(const fs::path& path) const
{
    std::error_code error;
    return fs::is_regular_file(path, error);
}

bool FilesystemImageSource::IsDirectory(const fs::path& path) const
{
    std::error_code error;
    return fs::is_directory(path, error);
}

std::vector<fs::path> FilesystemImageSource::ListImages(const fs::path& root) const
{
    return ListFiles(root, g_ValidImageExtensions);
}

std::vector<fs::path> FilesystemImageSource::ListFolders(const fs::path& root) const
{
    return ::ListFolders(root);
}
