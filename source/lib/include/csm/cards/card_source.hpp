#pragma once

#include <vector>

#include <csm/util.hpp>

class ImageSource;

struct CardPair
{
    fs::path m_Front;
    fs::path m_Back;

    bool operator==(const CardPair&) const = default;
};
using CardPairList = std::vector<CardPair>;

struct CardSources
{
    // Every image in m_NormalDir is printed with m_Backface on the back
    fs::path m_Backface;
    fs::path m_NormalDir;
    // Every sub-folder of m_DoubleFacedDir holds front and back images as consecutive pairs
    fs::path m_DoubleFacedDir;
};

CardPairList CollectSingleBackfaceCards(const ImageSource& source, const fs::path& normal_dir, const fs::path& backface);
CardPairList CollectDoubleFacedCards(const ImageSource& source, const fs::path& double_faced_dir);

// Single backface cards come first, followed by double-faced cards
CardPairList MergeCardSources(CardPairList single_backface_cards, CardPairList double_faced_cards);

// Paths that appear on more than one card face, sorted
std::vector<fs::path> FindSharedImages(const CardPairList& cards);

CardPairList CollectCards(const ImageSource& source, const CardSources& sources);
