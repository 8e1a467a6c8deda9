#include "TileSupply.hpp"

#include <algorithm>
#include <iterator>
#include "Exception.hpp"

namespace rummi::core::supply
{
    auto CreateSupply(IdSource& ids) -> std::vector<Tile>
    {
        std::vector<Tile> tiles;
        tiles.reserve(constants::TileCount);
        for (std::size_t copy{}; copy < constants::CopiesPerTile; ++copy)
        {
            for (Color const color : Suits)
            {
                for (std::uint8_t n{constants::MinNumber}; n <= constants::MaxNumber; ++n)
                {
                    tiles.push_back(Tile{.id = ids.Next(), .color = color, .number = n, .is_joker = false});
                }
            }
        }
        for (std::size_t j{}; j < constants::JokerCount; ++j)
        {
            tiles.push_back(Tile{.id = ids.Next(), .color = Color::Joker, .number = 0, .is_joker = true});
        }
        RMI_ASSERT(tiles.size() == constants::TileCount, "Supply does not hold the full tile set");
        return tiles;
    }

    auto Shuffle(std::vector<Tile> tiles, std::mt19937_64& rng) -> std::vector<Tile>
    {
        std::ranges::shuffle(tiles, rng);
        return tiles;
    }

    auto Deal(std::vector<Tile> pool, std::size_t n) -> DealResult
    {
        n = std::min(n, pool.size());
        DealResult res{};
        res.dealt.assign(std::make_move_iterator(pool.begin()),
                         std::make_move_iterator(pool.begin() + static_cast<std::ptrdiff_t>(n)));
        res.remaining.assign(std::make_move_iterator(pool.begin() + static_cast<std::ptrdiff_t>(n)),
                             std::make_move_iterator(pool.end()));
        return res;
    }
}
