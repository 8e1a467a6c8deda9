#ifndef RUMMIGAME_TYPES_HPP
#define RUMMIGAME_TYPES_HPP

#define RMI_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <array>
#include <random>
#include <variant>

namespace rummi::core::constants
{
    inline constexpr size_t  PlayerCount            = 4;
    inline constexpr size_t  HandSize               = 14;
    inline constexpr size_t  SuitCount              = 4;
    inline constexpr size_t  CopiesPerTile          = 2;
    inline constexpr size_t  JokerCount             = 2;
    inline constexpr uint8_t MinNumber              = 1;
    inline constexpr uint8_t MaxNumber              = 13;
    inline constexpr size_t  TileCount              = CopiesPerTile * SuitCount * MaxNumber + JokerCount;
    // 52 suited kinds + the joker kind
    inline constexpr size_t  TileKindCount          = SuitCount * MaxNumber + 1;
    inline constexpr size_t  MinSetSize             = 3;
    inline constexpr size_t  MaxGroupSize           = 4;
    inline constexpr uint32_t InitialMeldThreshold  = 30;
    inline constexpr uint32_t JokerPenalty          = 30;
}

namespace rummi::core
{
    enum class Color : uint8_t
    {
        Red = 0,
        Blue,
        Yellow,
        Black,
        Joker
    };

    inline constexpr std::array<Color, constants::SuitCount> Suits{
        Color::Red, Color::Blue, Color::Yellow, Color::Black
    };

    using TileId = uint32_t;
    using SetId = uint32_t;
    using PlyrIdxT = uint8_t;

    struct Tile
    {
        TileId id{};
        Color color{Color::Joker};
        // 1..13 for suited tiles, 0 for jokers
        uint8_t number{};
        bool is_joker{false};
    };
    // identity, not kind: two red 5s are different tiles
    inline auto operator==(Tile const& a, Tile const& b) -> bool { return a.id == b.id; }

    struct TileSet
    {
        SetId id{};
        std::vector<Tile> tiles;
    };

    enum class SetKind : uint8_t
    {
        Run,
        Group,
        Invalid
    };

    struct StagedSet
    {
        SetId id{};
        std::vector<Tile> tiles; // canonically arranged when a run
        bool is_valid{false};
        SetKind kind{SetKind::Invalid};
        uint32_t value{};

        // provenance, needed to reverse the staging
        std::vector<TileId> from_rack;
        std::vector<TileId> from_board;
    };

    struct Player
    {
        PlyrIdxT id{};
        std::string name;
        std::vector<Tile> rack;
        bool has_played_initial_meld{false};
        bool is_ai{false};
    };

    // Search caps of the computer opponent. Every loop of the planner is bounded by one of these.
    struct PlannerLimits
    {
        uint8_t  premeld_iterations{10};
        uint8_t  follow_up_depth{10};
        uint8_t  rearrange_rounds{4};
        uint32_t rearrange_per_size{64};
        uint32_t rearrange_total{1024};
    };

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        std::array<bool, constants::PlayerCount> ai_seats{false, true, true, true};
        std::array<std::string, constants::PlayerCount> names{"You", "AI 1", "AI 2", "AI 3"};
        PlannerLimits planner{};
    };
}

#endif //RUMMIGAME_TYPES_HPP
