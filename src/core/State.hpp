#ifndef RUMMIGAME_STATE_HPP
#define RUMMIGAME_STATE_HPP

#include "Types.hpp"

namespace rummi::core
{
    enum class TurnState : uint8_t
    {
        Selecting,
        Staging,
        AiThinking
    };

    enum class GamePhase : uint8_t
    {
        Playing,
        Ended
    };

    enum class EndReason : uint8_t
    {
        None,
        RackEmptied,
        Stalemate
    };

    // The whole game as a value. Transitions never mutate one in place, they return a new one.
    struct GameState
    {
        std::vector<Player> players;
        PlyrIdxT current_player_index{0};

        std::vector<TileSet> board;
        std::vector<Tile> pool;

        std::vector<TileId> selected_tiles;       // from the acting player's rack
        std::vector<TileId> selected_board_tiles;
        std::vector<StagedSet> staged_sets;

        TurnState turn_state{TurnState::Selecting};

        // turn-start snapshot used by CancelTurn
        std::vector<TileSet> board_before_turn;
        std::vector<Tile> rack_before_turn;

        uint32_t points_played_this_turn{0};
        uint32_t consecutive_passes{0};
        uint32_t turn_number{0};

        GamePhase game_phase{GamePhase::Playing};
        std::optional<PlyrIdxT> winner{};
        EndReason end_reason{EndReason::None};
    };
} // namespace rummi::core

#endif //RUMMIGAME_STATE_HPP
