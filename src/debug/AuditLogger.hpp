#ifndef RUMMIGAME_AUDITLOGGER_HPP
#define RUMMIGAME_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace rummi::core::debug
{
    // Plain-text transcript of one game, one file per game.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, seats, opening racks)
        auto start(GameState const& s, std::uint64_t seed) -> void;

        // Per turn (before ExecuteAITurn): actor seat, rack, board and the plan it chose
        auto turn(GameState const& s, TurnPlan const& plan) -> void;

        // Per turn (fallback when no plan was recorded)
        auto turn(GameState const& s) -> void;

        // Per turn (after ExecuteAITurn): what actually changed
        auto outcome(GameState const& before, GameState const& after) -> void;

        // Game end footer (winner seat and reason)
        auto end(GameState const& s) -> void;

    private:
        std::ofstream out_;
    };
}

#endif //RUMMIGAME_AUDITLOGGER_HPP
