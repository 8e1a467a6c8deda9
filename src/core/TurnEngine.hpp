#ifndef RUMMIGAME_TURNENGINE_HPP
#define RUMMIGAME_TURNENGINE_HPP

#include <expected>
#include <random>
#include <span>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Planner.hpp"
#include "Exception.hpp"
#include "Util.hpp"

namespace rummi::core
{
    using TurnResult = std::expected<GameState, error::TurnError>;

    // Owns every transition of a game. Transitions take the current state and return the next one;
    // a refused transition returns an error and the caller keeps the state it already has.
    // The engine itself only holds the seeded rng, the id source, the rules and the planner.
    class TurnEngine
    {
    public:
        TurnEngine() = delete;
        TurnEngine(Config const& config,
                   std::unique_ptr<Rules> rules,
                   std::unique_ptr<Planner> planner,
                   std::unique_ptr<IdSource> ids = std::make_unique<SequentialIdSource>());

        auto CreateInitialGameState() -> GameState;

        auto StartTurn(GameState const& state) const -> GameState;
        auto DrawTile(GameState const& state) const -> GameState;

        auto SelectTile(GameState const& state, TileId id) const -> GameState;
        auto SelectBoardTile(GameState const& state, TileId id) const -> GameState;

        auto StageCurrentSelection(GameState const& state) -> GameState;
        auto UnstageSingleSet(GameState const& state, SetId id) -> GameState;
        auto UnstageAllSets(GameState const& state) -> GameState;
        auto CommitAllStagedSets(GameState const& state) -> TurnResult;

        auto EndTurn(GameState const& state, bool drew_tile) -> TurnResult;
        auto CancelTurn(GameState const& state) const -> GameState;

        // DrawTile followed by EndTurn(true).
        auto DrawAndEndTurn(GameState const& state) -> TurnResult;

        // Plans the acting computer player's turn and plays it through the primitives above.
        auto ExecuteAITurn(GameState const& state) -> GameState;

        auto GetRules() const noexcept -> Rules const& { return *rules_; }
        auto GetPlanner() noexcept -> Planner* { return planner_.get(); }

    private:
        auto Acting(GameState const& state) const -> Player const&;
        auto ApplyPlay(GameState const& state, PlaySetAction const& act) -> GameState;
        auto ApplyRearrangement(GameState const& state, RearrangeAction const& act) -> GameState;
        auto StalemateWinner(GameState const& state) const -> PlyrIdxT;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::unique_ptr<Planner> planner_;
        std::unique_ptr<IdSource> ids_;
        std::mt19937_64 rng_;
    };
}
#endif //RUMMIGAME_TURNENGINE_HPP
