#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <unordered_set>

#include "TestTiles.hpp"
#include "../core/TileSupply.hpp"

using namespace rummi::test;

TEST(TileSupply, HoldsTwoOfEveryKind)
{
    SequentialIdSource ids{};
    std::vector<Tile> const supply = supply::CreateSupply(ids);
    ASSERT_EQ(supply.size(), constants::TileCount);

    std::array<std::size_t, constants::TileKindCount> counts{};
    std::unordered_set<TileId> seen;
    for (Tile const& t : supply)
    {
        ++counts[util::TileKindUID(t)];
        EXPECT_TRUE(seen.insert(t.id).second);
    }
    for (std::size_t const c : counts) EXPECT_EQ(c, constants::CopiesPerTile);
}

TEST(TileSupply, IdsComeFromTheInjectedSource)
{
    SequentialIdSource ids{100};
    std::vector<Tile> const supply = supply::CreateSupply(ids);
    EXPECT_EQ(supply.front().id, 100u);
    EXPECT_EQ(supply.back().id, 205u);
    EXPECT_TRUE(supply.back().is_joker);
    EXPECT_EQ(ids.Next(), 206u);
}

TEST(TileSupply, SeededShuffleRepeats)
{
    SequentialIdSource ids{};
    std::vector<Tile> const supply = supply::CreateSupply(ids);

    std::mt19937_64 a{42};
    std::mt19937_64 b{42};
    std::mt19937_64 c{43};
    auto const first = util::IdsOf(supply::Shuffle(supply, a));
    auto const second = util::IdsOf(supply::Shuffle(supply, b));
    auto const other = util::IdsOf(supply::Shuffle(supply, c));

    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);
    EXPECT_TRUE(std::ranges::is_permutation(first, util::IdsOf(supply)));
}

TEST(TileSupply, DealSplitsFront)
{
    std::vector<Tile> const pool{R(1, 1), R(2, 2), R(3, 3), R(4, 4)};
    supply::DealResult const res = supply::Deal(pool, 3);
    EXPECT_EQ(Ids(res.dealt), (std::vector<TileId>{1, 2, 3}));
    EXPECT_EQ(Ids(res.remaining), (std::vector<TileId>{4}));

    supply::DealResult const all = supply::Deal(pool, 10);
    EXPECT_EQ(all.dealt.size(), 4u);
    EXPECT_TRUE(all.remaining.empty());
}

TEST(Sorter, ColourThenNumber)
{
    std::vector<Tile> const sorted = SortRack({J(1), K(2, 1), R(3, 9), B(4, 2), R(5, 3)});
    EXPECT_EQ(Ids(sorted), (std::vector<TileId>{5, 3, 4, 2, 1}));
    EXPECT_TRUE(IsRackSorted(sorted));
}
