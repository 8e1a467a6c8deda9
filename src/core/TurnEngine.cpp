#include "TurnEngine.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <ranges>
#include <type_traits>
#include <utility>
#include <variant>

#include "Sorter.hpp"
#include "TileSupply.hpp"

namespace
{
    inline auto Viol(rummi::core::error::TurnErrorCode code) -> rummi::core::error::TurnError
    {
        return rummi::core::error::TurnError{ .code = code };
    }
}

namespace rummi::core
{
    using error::TurnErrorCode;

    TurnEngine::TurnEngine(Config const& config,
                           std::unique_ptr<Rules> rules,
                           std::unique_ptr<Planner> planner,
                           std::unique_ptr<IdSource> ids) :
        cfg_(config),
        rules_(std::move(rules)),
        planner_(std::move(planner)),
        ids_(std::move(ids)),
        rng_{cfg_.seed}
    {
        RMI_ASSERT(rules_ != nullptr, "Engine constructed without rules");
        RMI_ASSERT(planner_ != nullptr, "Engine constructed without a planner");
        RMI_ASSERT(ids_ != nullptr, "Engine constructed without an id source");
    }

    auto TurnEngine::Acting(GameState const& state) const -> Player const&
    {
        RMI_ASSERT(state.players.size() == constants::PlayerCount, "Game state does not hold exactly 4 players");
        RMI_ASSERT(state.current_player_index < state.players.size(), "Acting seat out of range");
        return state.players[state.current_player_index];
    }

    auto TurnEngine::CreateInitialGameState() -> GameState
    {
        std::vector<Tile> pool = supply::Shuffle(supply::CreateSupply(*ids_), rng_);

        GameState state{};
        for (PlyrIdxT seat{}; seat < constants::PlayerCount; ++seat)
        {
            auto [dealt, remaining] = supply::Deal(std::move(pool), constants::HandSize);
            pool = std::move(remaining);
            state.players.push_back(Player{
                .id = seat,
                .name = cfg_.names[seat],
                .rack = SortRack(std::move(dealt)),
                .has_played_initial_meld = false,
                .is_ai = cfg_.ai_seats[seat]
            });
        }
        state.pool = std::move(pool);
        state.current_player_index = 0;
        return StartTurn(state);
    }

    auto TurnEngine::StartTurn(GameState const& state) const -> GameState
    {
        Player const& actor = Acting(state);
        if (!state.staged_sets.empty())
            RMI_THROW(error::Code::State, "Turn started while staged sets are pending");

        GameState next = state;
        next.board_before_turn = next.board;
        next.rack_before_turn = actor.rack;
        next.selected_tiles.clear();
        next.selected_board_tiles.clear();
        next.points_played_this_turn = 0;
        next.turn_state = actor.is_ai ? TurnState::AiThinking : TurnState::Selecting;
        return next;
    }

    auto TurnEngine::DrawTile(GameState const& state) const -> GameState
    {
        if (state.pool.empty()) return state;

        // drawing gives up whatever was laid out this turn
        GameState next = CancelTurn(state);
        Player& actor = next.players[next.current_player_index];
        actor.rack.push_back(next.pool.front());
        next.pool.erase(next.pool.begin());
        actor.rack = SortRack(std::move(actor.rack));
        return next;
    }

    auto TurnEngine::SelectTile(GameState const& state, TileId const id) const -> GameState
    {
        if (!util::ContainsId(Acting(state).rack, id)) return state;

        GameState next = state;
        auto& sel = next.selected_tiles;
        if (auto const it = std::ranges::find(sel, id); it != sel.end())
            sel.erase(it);
        else
            sel.push_back(id);
        return next;
    }

    auto TurnEngine::SelectBoardTile(GameState const& state, TileId const id) const -> GameState
    {
        // the board is off limits until the initial meld is down
        if (!Acting(state).has_played_initial_meld) return state;

        bool const on_board = std::ranges::any_of(state.board, [id](TileSet const& s)
        {
            return util::ContainsId(s.tiles, id);
        });
        if (!on_board) return state;

        GameState next = state;
        auto& sel = next.selected_board_tiles;
        if (auto const it = std::ranges::find(sel, id); it != sel.end())
            sel.erase(it);
        else
            sel.push_back(id);
        return next;
    }

    auto TurnEngine::StageCurrentSelection(GameState const& state) -> GameState
    {
        if (state.selected_tiles.empty() && state.selected_board_tiles.empty()) return state;
        (void)Acting(state);

        GameState next = state;
        Player& actor = next.players[next.current_player_index];

        StagedSet staged{};
        std::vector<Tile> candidate;
        for (TileId const id : next.selected_tiles)
        {
            if (auto const t = util::FindById(actor.rack, id))
            {
                candidate.push_back(*t);
                staged.from_rack.push_back(id);
            }
        }
        for (TileId const id : next.selected_board_tiles)
        {
            for (TileSet const& set : next.board)
            {
                if (auto const t = util::FindById(set.tiles, id))
                {
                    candidate.push_back(*t);
                    staged.from_board.push_back(id);
                    break;
                }
            }
        }
        next.selected_tiles.clear();
        next.selected_board_tiles.clear();
        if (candidate.empty()) return next;

        SetCheck const check = rules_->Classify(candidate);
        staged.id = ids_->Next();
        staged.tiles = (check.kind == SetKind::Run) ? rules_->ArrangeRun(candidate) : std::move(candidate);
        staged.is_valid = check.IsValid();
        staged.kind = check.kind;
        staged.value = check.value;

        util::EraseIds(actor.rack, staged.from_rack);
        for (TileSet& set : next.board)
        {
            util::EraseIds(set.tiles, staged.from_board);
        }
        std::erase_if(next.board, [](TileSet const& s) { return s.tiles.empty(); });

        next.staged_sets.push_back(std::move(staged));
        next.turn_state = TurnState::Staging;
        return next;
    }

    auto TurnEngine::UnstageSingleSet(GameState const& state, SetId const id) -> GameState
    {
        auto const found = std::ranges::find(state.staged_sets, id, &StagedSet::id);
        if (found == state.staged_sets.end()) return state;
        (void)Acting(state);

        GameState next = state;
        auto const it = next.staged_sets.begin() + std::distance(state.staged_sets.begin(), found);
        StagedSet const staged = std::move(*it);
        next.staged_sets.erase(it);

        Player& actor = next.players[next.current_player_index];
        std::vector<Tile> board_tiles;
        for (Tile const& t : staged.tiles)
        {
            if (util::ContainsId(staged.from_rack, t.id))
                actor.rack.push_back(t);
            else if (util::ContainsId(staged.from_board, t.id))
                board_tiles.push_back(t);
            else
                RMI_THROW(error::Code::State, std::format("Staged tile {} has no recorded origin", t.id));
        }
        actor.rack = SortRack(std::move(actor.rack));

        // Out of their old context the board tiles may no longer be legal; they go back as one
        // unvalidated set and the turn cannot end until it is fixed or cancelled.
        if (!board_tiles.empty())
        {
            next.board.push_back(TileSet{.id = ids_->Next(), .tiles = std::move(board_tiles)});
        }

        if (next.staged_sets.empty()) next.turn_state = TurnState::Selecting;
        return next;
    }

    auto TurnEngine::UnstageAllSets(GameState const& state) -> GameState
    {
        GameState next = state;
        while (!next.staged_sets.empty())
        {
            next = UnstageSingleSet(next, next.staged_sets.front().id);
        }
        return next;
    }

    auto TurnEngine::CommitAllStagedSets(GameState const& state) -> TurnResult
    {
        PlyrIdxT const actor = Acting(state).id;
        if (state.staged_sets.empty())
            return std::unexpected(Viol(TurnErrorCode::NothingToCommit).with_actor(actor));

        for (std::size_t i{}; i < state.staged_sets.size(); ++i)
        {
            StagedSet const& s = state.staged_sets[i];
            if (!s.is_valid || !rules_->IsValidSet(s.tiles))
                return std::unexpected(Viol(TurnErrorCode::InvalidStagedSet)
                                       .with_actor(actor).with_set_index(i).with_set_id(s.id));
        }

        GameState next = state;
        for (StagedSet& s : next.staged_sets)
        {
            next.points_played_this_turn += s.value;
            next.board.push_back(TileSet{.id = ids_->Next(), .tiles = std::move(s.tiles)});
        }
        next.staged_sets.clear();
        next.turn_state = TurnState::Selecting;
        return next;
    }

    auto TurnEngine::StalemateWinner(GameState const& state) const -> PlyrIdxT
    {
        PlyrIdxT best{0};
        std::uint32_t lowest = rules_->RackValuation(state.players.front().rack);
        for (PlyrIdxT i{1}; i < state.players.size(); ++i)
        {
            std::uint32_t const v = rules_->RackValuation(state.players[i].rack);
            // strict: on a tie the earlier seat keeps it
            if (v < lowest)
            {
                lowest = v;
                best = i;
            }
        }
        return best;
    }

    auto TurnEngine::EndTurn(GameState const& state, bool const drew_tile) -> TurnResult
    {
        if (state.game_phase == GamePhase::Ended)
            RMI_THROW(error::Code::State, "EndTurn called after the game ended");
        PlyrIdxT const actor_idx = Acting(state).id;

        GameState next = state;
        if (!next.staged_sets.empty())
        {
            TurnResult committed = CommitAllStagedSets(next);
            if (!committed) return std::unexpected(committed.error());
            next = std::move(*committed);
        }

        for (std::size_t i{}; i < next.board.size(); ++i)
        {
            if (!rules_->IsValidSet(next.board[i].tiles))
                return std::unexpected(Viol(TurnErrorCode::BoardInvalidAfterCommit)
                                       .with_actor(actor_idx).with_set_index(i).with_set_id(next.board[i].id));
        }

        Player& actor = next.players[next.current_player_index];
        std::uint32_t const points = next.points_played_this_turn;
        // zero points is a plain draw or pass and needs no meld
        if (!actor.has_played_initial_meld && points > 0 && points < constants::InitialMeldThreshold)
            return std::unexpected(Viol(TurnErrorCode::MeldBelowThreshold)
                                   .with_actor(actor_idx)
                                   .with_points(points)
                                   .with_threshold(constants::InitialMeldThreshold));

        if (points >= constants::InitialMeldThreshold) actor.has_played_initial_meld = true;
        next.selected_tiles.clear();
        next.selected_board_tiles.clear();

        if (actor.rack.empty())
        {
            next.game_phase = GamePhase::Ended;
            next.winner = actor_idx;
            next.end_reason = EndReason::RackEmptied;
            next.points_played_this_turn = 0;
            return next;
        }

        bool const acted = points > 0 || drew_tile;
        next.consecutive_passes = acted ? 0 : next.consecutive_passes + 1;
        if (next.consecutive_passes >= next.players.size())
        {
            next.game_phase = GamePhase::Ended;
            next.winner = StalemateWinner(next);
            next.end_reason = EndReason::Stalemate;
            next.points_played_this_turn = 0;
            return next;
        }

        next.current_player_index = static_cast<PlyrIdxT>((next.current_player_index + 1) % next.players.size());
        ++next.turn_number;
        return StartTurn(next);
    }

    auto TurnEngine::CancelTurn(GameState const& state) const -> GameState
    {
        (void)Acting(state);
        GameState next = state;
        next.players[next.current_player_index].rack = next.rack_before_turn;
        next.board = next.board_before_turn;
        next.staged_sets.clear();
        next.selected_tiles.clear();
        next.selected_board_tiles.clear();
        next.points_played_this_turn = 0;
        next.turn_state = TurnState::Selecting;
        return next;
    }

    auto TurnEngine::DrawAndEndTurn(GameState const& state) -> TurnResult
    {
        bool const drew = !state.pool.empty();
        return EndTurn(DrawTile(state), drew);
    }

    auto TurnEngine::ApplyPlay(GameState const& state, PlaySetAction const& act) -> GameState
    {
        Player const& actor = Acting(state);
        bool const on_rack = !act.tiles.empty() && std::ranges::all_of(act.tiles, [&actor](TileId const id)
        {
            return util::ContainsId(actor.rack, id);
        });
        if (!on_rack)
        {
            std::print("[engine] P{} skipped a planned set: tiles are not on the rack\n", actor.id);
            return state;
        }

        GameState next = state;
        for (TileId const id : act.tiles)
        {
            next = SelectTile(next, id);
        }
        std::size_t const staged_before = next.staged_sets.size();
        next = StageCurrentSelection(next);
        if (next.staged_sets.size() != staged_before + 1 || !next.staged_sets.back().is_valid)
        {
            std::print("[engine] P{} skipped a planned set: it does not stage as a valid set\n", actor.id);
            return state;
        }

        TurnResult committed = CommitAllStagedSets(next);
        if (!committed)
        {
            std::print("[engine] P{} skipped a planned set: {}\n", actor.id, error::describe(committed.error()));
            return state;
        }
        return std::move(*committed);
    }

    auto TurnEngine::ApplyRearrangement(GameState const& state, RearrangeAction const& act) -> GameState
    {
        Player const& actor = Acting(state);
        bool const usable = actor.has_played_initial_meld &&
                            !act.from_rack.empty() &&
                            std::ranges::all_of(act.from_rack, [&actor](TileId const id)
                            {
                                return util::ContainsId(actor.rack, id);
                            });
        if (!usable)
        {
            std::print("[engine] P{} skipped a planned rearrangement: rack no longer matches\n", actor.id);
            return state;
        }

        GameState next = state;
        for (std::vector<TileId> const& ids : act.layout)
        {
            for (TileId const id : ids)
            {
                if (util::ContainsId(act.from_rack, id))
                    next = SelectTile(next, id);
                else
                    next = SelectBoardTile(next, id);
            }
            std::size_t const staged_before = next.staged_sets.size();
            next = StageCurrentSelection(next);
            bool const staged_ok = next.staged_sets.size() == staged_before + 1 &&
                                   next.staged_sets.back().is_valid &&
                                   next.staged_sets.back().tiles.size() == ids.size();
            if (!staged_ok)
            {
                std::print("[engine] P{} skipped a planned rearrangement: a new set does not stage cleanly\n",
                           actor.id);
                return state;
            }
        }

        // every tile of the old board has to have found a new home
        if (!next.board.empty() ||
            next.players[next.current_player_index].rack.size() != actor.rack.size() - act.from_rack.size())
        {
            std::print("[engine] P{} skipped a planned rearrangement: old board not fully re-homed\n", actor.id);
            return state;
        }

        TurnResult committed = CommitAllStagedSets(next);
        if (!committed)
        {
            std::print("[engine] P{} skipped a planned rearrangement: {}\n", actor.id,
                       error::describe(committed.error()));
            return state;
        }
        return std::move(*committed);
    }

    auto TurnEngine::ExecuteAITurn(GameState const& state) -> GameState
    {
        if (state.game_phase == GamePhase::Ended) return state;
        PlyrIdxT const actor_idx = Acting(state).id;

        TurnPlan const plan = planner_->Plan(state);

        GameState cur = state;
        bool drew = false;
        for (PlayerAction const& action : plan.actions)
        {
            bool const terminal = std::visit([&]<typename T0>(T0 const& act) -> bool
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, PlaySetAction>)
                {
                    cur = ApplyPlay(cur, act);
                    return false;
                }
                else if constexpr (std::is_same_v<T, RearrangeAction>)
                {
                    cur = ApplyRearrangement(cur, act);
                    return false;
                }
                else if constexpr (std::is_same_v<T, DrawAction>)
                {
                    if (!cur.pool.empty())
                    {
                        cur = DrawTile(cur);
                        drew = true;
                    }
                    return true;
                }
                else
                {
                    return true;
                }
            }, action);
            if (terminal) break;
        }

        TurnResult ended = EndTurn(cur, drew);
        if (ended) return std::move(*ended);
        std::print("[engine] P{} could not end its planned turn: {}\n", actor_idx, error::describe(ended.error()));

        // fall back to the turn-start position and just draw, or pass on an empty pool
        GameState fallback = CancelTurn(state);
        bool const fallback_drew = !fallback.pool.empty();
        if (fallback_drew) fallback = DrawTile(fallback);

        TurnResult retried = EndTurn(fallback, fallback_drew);
        if (!retried)
            RMI_THROW(error::Code::State, std::format("Fallback turn refused: {}", error::describe(retried.error())));
        return std::move(*retried);
    }
}
