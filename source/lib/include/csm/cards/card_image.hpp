#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <span>
#include <string>
#include <tuple>

#include <dla/vector.h>

#include <csm/image.hpp>
#include <csm/util.hpp>

enum class PrepareStatus
{
    Success,
    Fallback,
};

struct PreparedCard
{
    // Always exactly (card size + 2 * bleed) pixels, three channels
    Image m_Image;
    PrepareStatus m_Status;
    std::string m_FailureReason;

    bool IsFallback() const;
};

/*
        Scales the image to cover the card size, crops it to the card size around its center
        and surrounds it with a black bleed border
        Never throws, any failure results in a placeholder and a logged warning
*/
PreparedCard PrepareCard(const fs::path& image_path, dla::ivec2 card_size, int32_t bleed_edge);

// Black canvas of the bleed-inclusive size with a white card-size rectangle inset by the bleed
Image MakeFallbackCard(dla::ivec2 card_size, int32_t bleed_edge);

/*
        Thread-safe memoization of PrepareCard for images that are used by more than one card,
        usually the backface, so those are decoded once per run
        Images used only once are prepared on every call and never stored
*/
class PreparedCardCache
{
  public:
    PreparedCardCache() = default;
    explicit PreparedCardCache(std::span<const fs::path> shared_images);

    std::shared_ptr<const PreparedCard> Get(const fs::path& image_path, dla::ivec2 card_size, int32_t bleed_edge);

    bool IsShared(const fs::path& image_path) const;
    size_t Size() const;

  private:
    using Key = std::tuple<fs::path, int32_t, int32_t, int32_t>;

    const std::set<fs::path> m_SharedImages;

    mutable std::mutex m_Mutex;
    std::map<Key, std::shared_ptr<const PreparedCard>> m_Cache;
};
