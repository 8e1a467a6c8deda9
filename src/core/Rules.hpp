#ifndef RUMMIGAME_RULES_HPP
#define RUMMIGAME_RULES_HPP

#include <numeric>
#include <span>
#include "Types.hpp"

namespace rummi::core
{
    struct SetCheck
    {
        SetKind kind{SetKind::Invalid};
        std::uint32_t value{};

        [[nodiscard]]
        auto IsValid() const noexcept -> bool { return kind != SetKind::Invalid; }
    };

    class Rules
    {
    public:
        virtual ~Rules() = default;

        virtual auto IsValidRun(std::span<Tile const> tiles) const -> bool = 0;
        virtual auto IsValidGroup(std::span<Tile const> tiles) const -> bool = 0;

        // Runs are tried first, so {joker, joker, 5} is the run 3-4-5 and not a group of fives.
        virtual auto Classify(std::span<Tile const> tiles) const -> SetCheck = 0;

        // Canonical run order. Tiles that do not form a run are returned unchanged.
        virtual auto ArrangeRun(std::span<Tile const> tiles) const -> std::vector<Tile> = 0;

        // Penalty weight of tiles left on a rack, used to settle a stalemate.
        virtual auto RackValuation(std::span<Tile const> rack) const -> std::uint32_t = 0;

        auto IsValidSet(std::span<Tile const> tiles) const -> bool
        {
            return IsValidRun(tiles) || IsValidGroup(tiles);
        }

        auto CalculateSetValue(std::span<Tile const> tiles) const -> std::uint32_t
        {
            return Classify(tiles).value;
        }

        // Arranges runs canonically, leaves anything else as given.
        auto Arrange(std::span<Tile const> tiles) const -> std::vector<Tile>
        {
            if (IsValidRun(tiles)) return ArrangeRun(tiles);
            return {tiles.begin(), tiles.end()};
        }

        // The single board-wide gate checked before a turn may end.
        auto ValidateBoard(std::span<TileSet const> sets) const -> bool
        {
            for (TileSet const& s : sets)
            {
                if (!IsValidSet(s.tiles)) return false;
            }
            return true;
        }

        auto BoardValue(std::span<TileSet const> sets) const -> std::uint32_t
        {
            return std::accumulate(sets.begin(), sets.end(), std::uint32_t{0},
                                   [this](std::uint32_t acc, TileSet const& s)
                                   {
                                       return acc + CalculateSetValue(s.tiles);
                                   });
        }
    };
}

#endif //RUMMIGAME_RULES_HPP
