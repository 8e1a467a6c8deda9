#include "Sorter.hpp"

#include <algorithm>

namespace rummi::core
{
    auto RackLess(Tile const& a, Tile const& b) -> bool
    {
        if (ColorOrder(a.color) != ColorOrder(b.color)) return ColorOrder(a.color) < ColorOrder(b.color);
        return a.number < b.number;
    }

    auto SortRack(std::vector<Tile> tiles) -> std::vector<Tile>
    {
        std::ranges::stable_sort(tiles, RackLess);
        return tiles;
    }

    auto IsRackSorted(std::span<Tile const> tiles) -> bool
    {
        return std::ranges::is_sorted(tiles, RackLess);
    }
}
