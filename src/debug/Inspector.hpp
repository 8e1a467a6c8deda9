#ifndef RUMMIGAME_INSPECTOR_HPP
#define RUMMIGAME_INSPECTOR_HPP

#include <algorithm>
#include <iterator>
#include <vector>
#include <array>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/State.hpp"
#include "../core/Util.hpp"

namespace rummi::core::debug
{
    struct Inspector
    {
        // Every tile the state holds, grouped by where it lives.
        struct SnapshotAll
        {
            std::vector<std::vector<Tile const*>> racks;
            std::vector<Tile const*> board;
            std::vector<Tile const*> staged;
            std::vector<Tile const*> pool;

            std::array<std::size_t, constants::TileKindCount> kind_counts{};
            std::size_t total{};
        };

        static inline auto Gather(GameState const& g) -> SnapshotAll
        {
            SnapshotAll ret{};
            auto const addr = [](Tile const& t) -> Tile const* { return &t; };

            ret.racks.resize(g.players.size());
            for (size_t i{}; i < g.players.size(); ++i)
            {
                std::ranges::transform(g.players[i].rack, std::back_inserter(ret.racks[i]), addr);
            }
            for (TileSet const& s : g.board)
            {
                std::ranges::transform(s.tiles, std::back_inserter(ret.board), addr);
            }
            for (StagedSet const& s : g.staged_sets)
            {
                std::ranges::transform(s.tiles, std::back_inserter(ret.staged), addr);
            }
            std::ranges::transform(g.pool, std::back_inserter(ret.pool), addr);

            auto const count = [&ret](Tile const* t)
            {
                ++ret.kind_counts[util::TileKindUID(*t)];
                ++ret.total;
            };
            for (auto const& r : ret.racks) std::ranges::for_each(r, count);
            std::ranges::for_each(ret.board, count);
            std::ranges::for_each(ret.staged, count);
            std::ranges::for_each(ret.pool, count);

            return ret;
        }
    };
}

#endif //RUMMIGAME_INSPECTOR_HPP
