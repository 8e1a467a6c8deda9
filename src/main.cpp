#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <vector>

#include "core/TurnEngine.hpp"
#include "core/ClassicRules.hpp"
#include "core/GreedyPlanner.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/RecordingPlanner.hpp"

namespace
{
    struct RunConfig
    {
        std::uint64_t seed{123456789ULL};
        std::uint32_t games{1};
        std::uint32_t max_turns{2000};
        std::string   log_dir{};
        bool          quiet{false};
    };

    auto ParseArgs(int argc, char** argv) -> RunConfig
    {
        RunConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--games")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.games = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--max_turns")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.max_turns = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--log_dir")
            {
                if (i + 1 < argc) { cfg.log_dir = argv[++i]; }
            }
            else if (arg == "--quiet")
            {
                cfg.quiet = true;
            }
            else
            {
                std::print("[rummi] ignoring unknown argument '{}'\n", arg);
            }
        }
        return cfg;
    }

    auto ReasonName(rummi::core::EndReason const r) -> char const*
    {
        using rummi::core::EndReason;
        switch (r)
        {
            case EndReason::RackEmptied: return "rack emptied";
            case EndReason::Stalemate:   return "stalemate";
            case EndReason::None:        return "unfinished";
        }
        return "?";
    }

    // One all-computer game; returns the final state.
    auto PlayOne(RunConfig const& rc, std::uint64_t const seed) -> rummi::core::GameState
    {
        using namespace rummi::core;

        Config cfg{};
        cfg.seed = seed;
        cfg.ai_seats = {true, true, true, true};
        cfg.names = {"AI 0", "AI 1", "AI 2", "AI 3"};

        auto planner = std::make_unique<debug::RecordingPlanner>(std::make_unique<GreedyPlanner>(cfg.planner));
        TurnEngine engine(cfg, std::make_unique<ClassicRules>(), std::move(planner));

        std::optional<debug::AuditLogger> log;
        if (!rc.log_dir.empty())
        {
            std::filesystem::create_directories(rc.log_dir);
            log.emplace(std::format("{}/game_{}.log", rc.log_dir, seed));
        }

        GameState state = engine.CreateInitialGameState();
        if (log) log->start(state, seed);

        while (state.game_phase == GamePhase::Playing && state.turn_number < rc.max_turns)
        {
            GameState next = engine.ExecuteAITurn(state);
            if (log)
            {
                auto* rec = debug::AsRecording(engine.GetPlanner());
                if (rec && rec->HasLast())
                    log->turn(state, rec->Last());
                else
                    log->turn(state);
                log->outcome(state, next);
            }
            state = std::move(next);
        }

        if (log) log->end(state);
        return state;
    }
}

int main(int argc, char** argv)
{
    using namespace rummi::core;

    RunConfig const rc = ParseArgs(argc, argv);
    std::print("[rummi] {} game(s) from seed {}\n", rc.games, rc.seed);

    std::vector<std::uint32_t> wins(constants::PlayerCount, 0);
    std::uint32_t stalemates{0};
    std::uint32_t unfinished{0};

    try
    {
        for (std::uint32_t g{}; g < rc.games; ++g)
        {
            std::uint64_t const seed = rc.seed + g;
            GameState const end = PlayOne(rc, seed);

            if (end.winner) ++wins[*end.winner];
            if (end.end_reason == EndReason::Stalemate) ++stalemates;
            if (end.game_phase != GamePhase::Ended) ++unfinished;

            if (!rc.quiet)
            {
                std::print("[rummi] seed {} -> winner {} ({}) after {} turns\n",
                           seed,
                           end.winner ? std::format("P{}", static_cast<int>(*end.winner)) : std::string("none"),
                           ReasonName(end.end_reason),
                           end.turn_number);
            }
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}\n", e);
        return 1;
    }

    for (PlyrIdxT i{}; i < constants::PlayerCount; ++i)
    {
        std::print("[rummi] P{} won {}\n", static_cast<int>(i), wins[i]);
    }
    std::print("[rummi] stalemates {} unfinished {}\n", stalemates, unfinished);
    return 0;
}
