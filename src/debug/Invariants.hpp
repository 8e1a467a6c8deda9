#ifndef RUMMIGAME_INVARIANTS_HPP
#define RUMMIGAME_INVARIANTS_HPP

#include "../core/Rules.hpp"
#include "../core/State.hpp"
#include "Inspector.hpp"
#include <format>
#include <string>
#include <unordered_set>
#include <vector>

namespace rummi::core::debug
{
    // A second layer of checks run by the self-play tests after every transition.
    // Returns one line per broken invariant; empty means the state is sound.
    inline auto CheckInvariants(GameState const& g, Rules const& rules, bool const expect_valid_board = true)
        -> std::vector<std::string>
    {
        std::vector<std::string> broken;
#if RMI_ENABLE_TEST_HOOKS == false
        (void)g;
        (void)rules;
        (void)expect_valid_board;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(g);

        // 1) Seat count and acting seat
        if (g.players.size() != constants::PlayerCount)
            broken.push_back(std::format("player count {} != {}", g.players.size(), constants::PlayerCount));
        if (g.current_player_index >= g.players.size())
            broken.push_back(std::format("acting seat {} out of range", static_cast<int>(g.current_player_index)));

        // 2) Conservation: 106 tiles, two of each suited kind, two jokers
        if (s.total != constants::TileCount)
            broken.push_back(std::format("tile total {} != {}", s.total, constants::TileCount));
        for (size_t k{}; k < s.kind_counts.size(); ++k)
        {
            if (s.kind_counts[k] != constants::CopiesPerTile)
                broken.push_back(std::format("tile kind {} appears {} times", k, s.kind_counts[k]));
        }

        // 3) No tile id in two places at once
        {
            std::unordered_set<TileId> seen;
            seen.reserve(constants::TileCount);
            auto push_unique = [&](Tile const* t)
            {
                if (!seen.insert(t->id).second)
                    broken.push_back(std::format("tile id {} held twice", t->id));
            };
            for (auto const& r : s.racks) for (auto const t : r) push_unique(t);
            for (auto const t : s.board) push_unique(t);
            for (auto const t : s.staged) push_unique(t);
            for (auto const t : s.pool) push_unique(t);
        }

        // 4) Staging state matches staged sets
        if (!g.staged_sets.empty() && g.turn_state != TurnState::Staging)
            broken.emplace_back("staged sets present outside the Staging state");
        if (g.staged_sets.empty() && g.turn_state == TurnState::Staging)
            broken.emplace_back("Staging state without staged sets");

        // 5) Board legality, which only holds between turns
        if (expect_valid_board && !rules.ValidateBoard(g.board))
            broken.emplace_back("board holds an invalid set");

        // 6) An ended game names its winner
        if ((g.game_phase == GamePhase::Ended) != g.winner.has_value())
            broken.emplace_back("winner and game phase disagree");
#endif // RMI_ENABLE_TEST_HOOKS == true
        return broken;
    }

    // Properties that relate two consecutive states.
    inline auto CheckTransition(GameState const& before, GameState const& after) -> std::vector<std::string>
    {
        std::vector<std::string> broken;
#if RMI_ENABLE_TEST_HOOKS == false
        (void)before;
        (void)after;
#else
        for (size_t i{}; i < before.players.size() && i < after.players.size(); ++i)
        {
            if (before.players[i].has_played_initial_meld && !after.players[i].has_played_initial_meld)
                broken.push_back(std::format("P{} lost its initial meld", i));
        }
        if (before.game_phase == GamePhase::Ended && after.game_phase != GamePhase::Ended)
            broken.emplace_back("ended game resumed");
#endif // RMI_ENABLE_TEST_HOOKS == true
        return broken;
    }
}
#endif //RUMMIGAME_INVARIANTS_HPP
