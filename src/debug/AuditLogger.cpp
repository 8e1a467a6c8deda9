#include "AuditLogger.hpp"

#include <array>
#include <format>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

using namespace rummi::core;

namespace
{

auto s_color(Color const c) -> std::string_view
{
    switch (c)
    {
        case Color::Red:    return "r";
        case Color::Blue:   return "b";
        case Color::Yellow: return "y";
        case Color::Black:  return "k";
        case Color::Joker:  return "J";
    }
    return "?";
}

auto s_tile(Tile const& t) -> std::string
{
    if (t.is_joker) return "J";
    return std::format("{}{}", static_cast<int>(t.number), s_color(t.color));
}

auto s_tiles(std::span<Tile const> tiles) -> std::string
{
    std::string body;
    for (size_t i{}; i < tiles.size(); ++i)
    {
        body += (i ? "," : "");
        body += s_tile(tiles[i]);
    }
    return body;
}

auto s_ids(std::span<TileId const> ids) -> std::string
{
    std::string body;
    for (size_t i{}; i < ids.size(); ++i)
    {
        body += std::format("{}{}", (i ? "," : ""), ids[i]);
    }
    return body;
}

auto s_action(PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaySetAction>)
            {
                return std::format("Play[{}]={}", s_ids(act.tiles), act.value);
            }
            else if constexpr (std::is_same_v<T, RearrangeAction>)
            {
                std::string sets;
                for (size_t i{}; i < act.layout.size(); ++i)
                {
                    sets += std::format("{}[{}]", (i ? "," : ""), s_ids(act.layout[i]));
                }
                return std::format("Rearrange(rack=[{}] layout={{{}}})", s_ids(act.from_rack), sets);
            }
            else if constexpr (std::is_same_v<T, DrawAction>)
            {
                return "Draw";
            }
            else
            {
                return "Pass";
            }
        },
        a
    );
}

auto serialize_board(GameState const& s) -> std::string
{
    std::string serial;
    for (size_t i{}; i < s.board.size(); ++i)
    {
        serial += std::format("{}[{}]", (i ? " " : ""), s_tiles(s.board[i].tiles));
    }
    return serial;
}

auto s_reason(EndReason const r) -> std::string_view
{
    switch (r)
    {
        case EndReason::None:        return "None";
        case EndReason::RackEmptied: return "RackEmptied";
        case EndReason::Stalemate:   return "Stalemate";
    }
    return "?";
}

} // anonymous namespace

namespace rummi::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& s, uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={} Pool={}\n", s.players.size(), s.pool.size());
    for (Player const& p : s.players)
    {
        out_ << std::format("P{} {} ai={} rack=[{}]\n",
                            static_cast<int>(p.id), p.name, p.is_ai, s_tiles(p.rack));
    }
    out_.flush();
}

auto AuditLogger::turn(GameState const& s, TurnPlan const& plan) -> void
{
    turn(s);

    std::string body;
    for (size_t i{}; i < plan.actions.size(); ++i)
    {
        body += (i ? " " : "");
        body += s_action(plan.actions[i]);
    }
    out_ << std::format("Plan: {}\n", body);
}

auto AuditLogger::turn(GameState const& s) -> void
{
    Player const& p = s.players.at(s.current_player_index);
    out_ << std::format(
        "Turn {} actor=P{} meld={} pool={} rack=[{}]\n",
        s.turn_number,
        static_cast<int>(p.id),
        p.has_played_initial_meld,
        s.pool.size(),
        s_tiles(p.rack)
    );
    out_ << std::format("Board: {}\n", serialize_board(s));
}

auto AuditLogger::outcome(GameState const& before, GameState const& after) -> void
{
    Player const& p_before = before.players.at(before.current_player_index);
    Player const& p_after = after.players.at(before.current_player_index);

    long const rack_delta = static_cast<long>(p_after.rack.size()) - static_cast<long>(p_before.rack.size());
    char const* txt =
        (after.game_phase == GamePhase::Ended ? "GameEnded" :
        (rack_delta < 0                       ? "Played" :
        (rack_delta > 0                       ? "Drew" : "Passed")));
    out_ << std::format("Outcome: {} rack{:+} passes={}\n", txt, rack_delta, after.consecutive_passes);
}

auto AuditLogger::end(GameState const& s) -> void
{
    int const winner = s.winner ? static_cast<int>(*s.winner) : -1;
    out_ << std::format("Winner={} Reason={} Turns={}\n", winner, s_reason(s.end_reason), s.turn_number);
    out_.flush();
}

} // namespace rummi::core::debug
