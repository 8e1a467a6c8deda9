#ifndef RUMMIGAME_SORTER_HPP
#define RUMMIGAME_SORTER_HPP

#include <span>
#include "Types.hpp"

namespace rummi::core
{
    // Display order of suits on a rack: red, blue, yellow, black, then jokers.
    inline constexpr auto ColorOrder(Color const c) -> std::uint8_t { return static_cast<std::uint8_t>(c); }

    // Strict weak order on (color, number). Equal kinds keep their relative order under a stable sort.
    auto RackLess(Tile const& a, Tile const& b) -> bool;

    // Canonical rack ordering: color, then number.
    auto SortRack(std::vector<Tile> tiles) -> std::vector<Tile>;

    auto IsRackSorted(std::span<Tile const> tiles) -> bool;
}

#endif //RUMMIGAME_SORTER_HPP
