#include <csm/util.hpp>

#include <cctype>
#include <ranges>
#include <system_error>

#include <csm/util/log.hpp>

namespace
{
template<class PredT>
std::vector<fs::path> ListDirectory(const fs::path& path, PredT&& predicate)
{
    std::vector<fs::path> entries;

    std::error_code error;
    if (!fs::is_directory(path, error))
    {
        if (error)
        {
            LogWarning("Can not access {}: {}", path.string(), error.message());
        }
        return entries;
    }

    fs::directory_iterator it{ path, error };
    for (; !error && it != fs::directory_iterator{}; it.increment(error))
    {
        if (predicate(*it))
        {
            entries.push_back(it->path());
        }
    }

    if (error)
    {
        LogWarning("Failed listing {}: {}", path.string(), error.message());
        return {};
    }

    std::ranges::sort(entries, {}, [](const fs::path& entry)
                      { return entry.filename(); });
    return entries;
}
} // namespace

std::string ToLower(std::string str)
{
    std::ranges::transform(str, str.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool HasMatchingExtension(const fs::path& path, const std::span<const fs::path> extensions)
{
    const std::string extension{ ToLower(path.extension().string()) };
    return std::ranges::any_of(extensions, [&](const fs::path& valid_extension)
                               { return ToLower(valid_extension.string()) == extension; });
}

std::vector<fs::path> ListFiles(const fs::path& path, const std::span<const fs::path> extensions)
{
    return ListDirectory(path,
                         [&](const fs::directory_entry& entry)
                         {
                             std::error_code error;
                             return !entry.is_directory(error) &&
                                    (extensions.empty() || HasMatchingExtension(entry.path(), extensions));
                         });
}

std::vector<fs::path> ListFolders(const fs::path& path)
{
    return ListDirectory(path,
                         [](const fs::directory_entry& entry)
                         {
                             std::error_code error;
                             return entry.is_directory(error);
                         });
}
