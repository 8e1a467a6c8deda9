#ifndef RUMMIGAME_GREEDYPLANNER_HPP
#define RUMMIGAME_GREEDYPLANNER_HPP

#include <optional>
#include <span>
#include "Planner.hpp"
#include "ClassicRules.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace rummi::core
{
    // Computer opponent: always takes the most valuable play it can see.
    class GreedyPlanner final : public Planner
    {
    public:
        struct PossiblePlay
        {
            std::vector<Tile> tiles; // arranged as it would be staged
            std::uint32_t value{};
            SetKind kind{SetKind::Invalid};
        };

        struct Rearrangement
        {
            std::vector<Tile> from_rack;
            std::vector<std::vector<Tile>> layout; // replaces the whole board
        };

        explicit GreedyPlanner(PlannerLimits limits = {});

        auto Plan(GameState const& snapshot) -> TurnPlan override;

        // Every run and group the rack can form on its own, most valuable first.
        // Equal values keep enumeration order: runs by suit and window, then groups by number.
        auto FindPossiblePlays(std::span<Tile const> rack) const -> std::vector<PossiblePlay>;

        // Largest rack subset that, together with every board tile, splits into valid sets.
        auto FindRearrangement(std::span<Tile const> rack,
                               std::span<TileSet const> board) const -> std::optional<Rearrangement>;

        // Greedy split of all given tiles into valid sets; nullopt if any tile is left over.
        auto Partition(std::span<Tile const> tiles) const -> std::optional<std::vector<std::vector<Tile>>>;

    private:
        enum class PassOrder : std::uint8_t
        {
            GroupsThenRuns,
            RunsThenGroups
        };

        auto PlanInitialMeld(GameState const& s) const -> TurnPlan;
        auto PlanRegularTurn(GameState const& s) const -> TurnPlan;

        auto FindPossibleRuns(std::span<Tile const> rack, std::vector<PossiblePlay>& out) const -> void;
        auto FindPossibleGroups(std::span<Tile const> rack, std::vector<PossiblePlay>& out) const -> void;
        auto AddCandidate(std::vector<Tile> tiles, std::vector<PossiblePlay>& out) const -> void;

        auto PartitionWith(std::span<Tile const> tiles, PassOrder order) const
            -> std::optional<std::vector<std::vector<Tile>>>;
        auto AbsorbLeftovers(std::vector<Tile>& remaining, std::vector<std::vector<Tile>>& sets) const -> void;

    private:
        ClassicRules rules_;
        PlannerLimits limits_;
    };
}

#endif //RUMMIGAME_GREEDYPLANNER_HPP
