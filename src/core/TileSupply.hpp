#ifndef RUMMIGAME_TILESUPPLY_HPP
#define RUMMIGAME_TILESUPPLY_HPP

#include <random>
#include "Types.hpp"
#include "Util.hpp"

namespace rummi::core::supply
{
    struct DealResult
    {
        std::vector<Tile> dealt;
        std::vector<Tile> remaining;
    };

    // The fixed 106 tiles: two copies of every suit 1..13, then the two jokers, each with a fresh id.
    auto CreateSupply(IdSource& ids) -> std::vector<Tile>;

    // Uniform permutation; the same seed always gives the same order.
    auto Shuffle(std::vector<Tile> tiles, std::mt19937_64& rng) -> std::vector<Tile>;

    // Splits the first n tiles off the front. Order is kept, n larger than the pool deals everything.
    auto Deal(std::vector<Tile> pool, std::size_t n) -> DealResult;
}

#endif //RUMMIGAME_TILESUPPLY_HPP
