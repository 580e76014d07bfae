#include <csm/cards/card_source.hpp>

#include <map>

#include <csm/cards/image_source.hpp>
#include <csm/util/log.hpp>

CardPairList CollectSingleBackfaceCards(const ImageSource& source, const fs::path& normal_dir, const fs::path& backface)
{
    if (!source.Exists(backface))
    {
        LogWarning("Backface image {} not found, skipping single backface cards", backface.string());
        return {};
    }

    if (!source.IsDirectory(normal_dir))
    {
        LogInfo("No single backface cards, {} is not a folder", normal_dir.string());
        return {};
    }

    CardPairList cards;
    for (fs::path& front : source.ListImages(normal_dir))
    {
        cards.push_back(CardPair{ std::move(front), backface });
    }

    LogInfo("Found {} single backface cards in {}", cards.size(), normal_dir.string());
    return cards;
}

CardPairList CollectDoubleFacedCards(const ImageSource& source, const fs::path& double_faced_dir)
{
    if (!source.IsDirectory(double_faced_dir))
    {
        LogInfo("No double-faced cards, {} is not a folder", double_faced_dir.string());
        return {};
    }

    CardPairList cards;
    for (const fs::path& folder : source.ListFolders(double_faced_dir))
    {
        std::vector<fs::path> images{ source.ListImages(folder) };
        if (images.size() % 2 != 0)
        {
            LogDebug("Dropping unpaired image {}", images.back().string());
            images.pop_back();
        }

        for (size_t i = 0; i < images.size(); i += 2)
        {
            cards.push_back(CardPair{ std::move(images[i]), std::move(images[i + 1]) });
        }
    }

    LogInfo("Found {} double-faced cards in {}", cards.size(), double_faced_dir.string());
    return cards;
}

CardPairList MergeCardSources(CardPairList single_backface_cards, CardPairList double_faced_cards)
{
    CardPairList cards{ std::move(single_backface_cards) };
    cards.insert(cards.end(),
                 std::make_move_iterator(double_faced_cards.begin()),
                 std::make_move_iterator(double_faced_cards.end()));
    return cards;
}

std::vector<fs::path> FindSharedImages(const CardPairList& cards)
{
    std::map<fs::path, size_t> usage_count;
    for (const CardPair& card : cards)
    {
        ++usage_count[card.m_Front];
        ++usage_count[card.m_Back];
    }

    std::vector<fs::path> shared_images;
    for (const auto& [path, count] : usage_count)
    {
        if (count > 1)
        {
            shared_images.push_back(path);
        }
    }
    return shared_images;
}

CardPairList CollectCards(const ImageSource& source, const CardSources& sources)
{
    return MergeCardSources(CollectSingleBackfaceCards(source, sources.m_NormalDir, sources.m_Backface),
                            CollectDoubleFacedCards(source, sources.m_DoubleFacedDir));
}
