#ifndef RUMMIGAME_EXCEPTION_HPP
#define RUMMIGAME_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <source_location>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"

namespace rummi::core::error
{
    enum class Code : unsigned
    {
        State, // malformed or misused game state
        Planner, // planner produced something the engine cannot use
        Assertion // internal assertion failed
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct PlannerError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg, std::source_location const& at = std::source_location::current()) -> void
    {
        // `at` defaults at the call site, so the report names the RMI_THROW / RMI_ASSERT line
        switch (c)
        {
        case Code::State: throw StateError(std::move(msg), c, at);
        case Code::Planner: throw PlannerError(std::move(msg), c, at);
        case Code::Assertion: throw AssertionError(std::move(msg), c, at);
        }
        throw std::runtime_error(msg);
    }

#define RMI_THROW(code_enum, msg) ::rummi::core::error::fail((code_enum), (msg))
#define RMI_ASSERT(cond, msg) do { if(!(cond)) ::rummi::core::error::fail(::rummi::core::error::Code::Assertion, (msg)); } while(0)

    // Ordinary, recoverable reasons a turn transition is refused.
    enum class TurnErrorCode : std::uint16_t
    {
        NothingToCommit,
        InvalidStagedSet,
        BoardInvalidAfterCommit,
        MeldBelowThreshold
    };

    struct TurnError
    {
        TurnErrorCode code{};
        std::optional<PlyrIdxT> actor{};
        std::optional<std::uint32_t> points{};
        std::optional<std::uint32_t> threshold{};
        std::optional<std::size_t> set_index{}; // staged set or board set, depending on code
        std::optional<SetId> set_id{};

        auto with_actor(PlyrIdxT s) -> TurnError&
        {
            actor = s;
            return *this;
        }

        auto with_points(std::uint32_t v) -> TurnError&
        {
            points = v;
            return *this;
        }

        auto with_threshold(std::uint32_t v) -> TurnError&
        {
            threshold = v;
            return *this;
        }

        auto with_set_index(std::size_t i) -> TurnError&
        {
            set_index = i;
            return *this;
        }

        auto with_set_id(SetId id) -> TurnError&
        {
            set_id = id;
            return *this;
        }
    };

    inline auto to_string(TurnErrorCode c) -> std::string_view
    {
        using E = TurnErrorCode;
        switch (c)
        {
        case E::NothingToCommit: return "Nothing to commit: stage at least one set first";
        case E::InvalidStagedSet: return "Invalid set: every staged set must be a valid run or group";
        case E::BoardInvalidAfterCommit:
            return "Invalid board: all sets must be valid runs or groups of at least 3 tiles. Cancel to undo changes";
        case E::MeldBelowThreshold: return "Initial meld below threshold: play more sets or cancel";
        }
        return "Unknown";
    }

    inline auto describe(TurnError const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.points) s += std::format(" | points={}", *v.points);
        if (v.threshold) s += std::format(" | need={}", *v.threshold);
        if (v.set_index) s += std::format(" | set#{}", *v.set_index);
        if (v.set_id) s += std::format(" | set_id={}", *v.set_id);
        return s;
    }
}

#endif //RUMMIGAME_EXCEPTION_HPP
