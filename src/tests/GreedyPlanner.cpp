#include <gtest/gtest.h>

#include <algorithm>

#include "TestTiles.hpp"

using namespace rummi::test;

namespace
{
    // Returns whatever plan it was handed, whether or not it fits the position.
    class ScriptedPlanner final : public Planner
    {
    public:
        explicit ScriptedPlanner(TurnPlan plan) : plan_(std::move(plan)) {}

        auto Plan(GameState const& snapshot) -> TurnPlan override
        {
            (void)snapshot;
            return plan_;
        }

    private:
        TurnPlan plan_;
    };

    auto PlannerFor(TurnEngine& engine) -> GreedyPlanner&
    {
        return dynamic_cast<GreedyPlanner&>(*engine.GetPlanner());
    }
}

TEST(GreedyPlanner, PlaysAreOrderedByValue)
{
    GreedyPlanner const planner{};
    std::vector<Tile> const rack{R(1, 10), R(2, 11), R(3, 12), B(4, 3), Y(5, 3), K(6, 3)};
    auto const plays = planner.FindPossiblePlays(rack);

    ASSERT_EQ(plays.size(), 2u);
    EXPECT_EQ(plays[0].value, 33u);
    EXPECT_EQ(plays[0].kind, SetKind::Run);
    EXPECT_EQ(plays[1].value, 9u);
    EXPECT_EQ(plays[1].kind, SetKind::Group);
}

TEST(GreedyPlanner, JokerWindowOfTwo)
{
    GreedyPlanner const planner{};
    auto const plays = planner.FindPossiblePlays(std::vector<Tile>{R(1, 5), R(2, 6), J(3)});
    ASSERT_EQ(plays.size(), 1u);
    EXPECT_EQ(plays[0].value, 15u);
    EXPECT_TRUE(plays[0].tiles.front().is_joker);
}

TEST(GreedyPlanner, JokerCompletesGroupOfThree)
{
    GreedyPlanner const planner{};
    auto const plays = planner.FindPossiblePlays(std::vector<Tile>{R(1, 9), B(2, 9), J(3)});
    ASSERT_EQ(plays.size(), 1u);
    EXPECT_EQ(plays[0].kind, SetKind::Group);
    EXPECT_EQ(plays[0].value, 27u);
    EXPECT_EQ(plays[0].tiles.size(), 3u);
}

TEST(GreedyPlanner, JokerGroupOfFourRanksFirst)
{
    GreedyPlanner const planner{};
    auto const plays = planner.FindPossiblePlays(std::vector<Tile>{R(1, 9), B(2, 9), Y(3, 9), J(4)});

    // the plain group, three pairs with the joker, and all four together
    ASSERT_EQ(plays.size(), 5u);
    EXPECT_EQ(plays[0].kind, SetKind::Group);
    EXPECT_EQ(plays[0].value, 36u);
    EXPECT_EQ(plays[0].tiles.size(), 4u);
    for (std::size_t i{1}; i < plays.size(); ++i)
    {
        EXPECT_EQ(plays[i].kind, SetKind::Group);
        EXPECT_EQ(plays[i].value, 27u);
        EXPECT_EQ(plays[i].tiles.size(), 3u);
    }
    EXPECT_TRUE(std::ranges::none_of(plays[1].tiles, &Tile::is_joker));
}

TEST(GreedyPlanner, TwoJokersAndOneTileEnumerateAsRun)
{
    GreedyPlanner const planner{};
    auto const plays = planner.FindPossiblePlays(std::vector<Tile>{R(1, 9), J(2), J(3)});
    ASSERT_EQ(plays.size(), 1u);
    EXPECT_EQ(plays[0].kind, SetKind::Run);
    EXPECT_EQ(plays[0].value, 24u);
    ASSERT_EQ(plays[0].tiles.size(), 3u);
    EXPECT_TRUE(plays[0].tiles[0].is_joker);
    EXPECT_TRUE(plays[0].tiles[1].is_joker);
    EXPECT_EQ(plays[0].tiles[2].id, 1u);
}

TEST(GreedyPlanner, DuplicateNumbersDoNotMultiplyRuns)
{
    GreedyPlanner const planner{};
    auto const plays = planner.FindPossiblePlays(std::vector<Tile>{R(1, 4), R(2, 5), R(3, 6), R(4, 6)});
    ASSERT_EQ(plays.size(), 1u);
    EXPECT_EQ(plays[0].value, 15u);
}

TEST(GreedyPlanner, NothingFromScatteredTiles)
{
    GreedyPlanner const planner{};
    EXPECT_TRUE(planner.FindPossiblePlays(std::vector<Tile>{R(1, 1), B(2, 5), K(3, 9)}).empty());
    EXPECT_TRUE(planner.FindPossiblePlays(std::vector<Tile>{}).empty());
}

TEST(GreedyPlanner, PartitionTriesBothPassOrders)
{
    GreedyPlanner const planner{};
    std::vector<Tile> const tiles{R(1, 1), R(2, 2), R(3, 3), R(4, 4), B(5, 3), Y(6, 3), K(7, 3)};
    auto const sets = planner.Partition(tiles);
    ASSERT_TRUE(sets.has_value());
    EXPECT_EQ(sets->size(), 2u);

    EXPECT_FALSE(planner.Partition(std::vector<Tile>{R(1, 1), R(2, 2), R(3, 3), B(4, 3), Y(5, 3)}).has_value());
}

TEST(GreedyPlanner, PreMeldBelowThresholdDraws)
{
    TurnEngine engine = MakeEngine();
    GameState const s = MakeState({R(1, 1), R(2, 2), R(3, 3), B(4, 5), Y(5, 9)}, {}, false, {K(60, 4)});

    TurnPlan const plan = PlannerFor(engine).Plan(s);
    ASSERT_EQ(plan.actions.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<DrawAction>(plan.actions[0]));

    GameState const next = engine.ExecuteAITurn(s);
    EXPECT_TRUE(next.board.empty());
    EXPECT_EQ(next.players[0].rack.size(), 6u);
    EXPECT_FALSE(next.players[0].has_played_initial_meld);
    EXPECT_EQ(next.current_player_index, 1);
    EXPECT_EQ(next.consecutive_passes, 0u);
}

TEST(GreedyPlanner, PreMeldWithEmptyPoolPasses)
{
    TurnEngine engine = MakeEngine();
    GameState const s = MakeState({R(1, 1), R(2, 2), R(3, 3)});

    GameState const next = engine.ExecuteAITurn(s);
    EXPECT_TRUE(next.board.empty());
    EXPECT_EQ(next.players[0].rack.size(), 3u);
    EXPECT_EQ(next.consecutive_passes, 1u);
}

TEST(GreedyPlanner, PreMeldAboveThresholdPlaysEverything)
{
    TurnEngine engine = MakeEngine();
    GameState const s = MakeState({R(1, 10), R(2, 11), R(3, 12), B(4, 3), Y(5, 3), K(6, 3), B(7, 9)});

    GameState const next = engine.ExecuteAITurn(s);
    EXPECT_EQ(next.board.size(), 2u);
    EXPECT_TRUE(next.players[0].has_played_initial_meld);
    EXPECT_EQ(Ids(next.players[0].rack), (std::vector<TileId>{7}));
    EXPECT_TRUE(engine.GetRules().ValidateBoard(next.board));
}

TEST(GreedyPlanner, AfterMeldPlaysSeveralSets)
{
    TurnEngine engine = MakeEngine();
    GameState const s = MakeState({R(1, 1), R(2, 2), R(3, 3), B(4, 5), Y(5, 5), K(6, 5), K(7, 9)}, {}, true);

    TurnPlan const plan = PlannerFor(engine).Plan(s);
    ASSERT_EQ(plan.actions.size(), 2u);
    EXPECT_EQ(std::get<PlaySetAction>(plan.actions[0]).value, 15u);
    EXPECT_EQ(std::get<PlaySetAction>(plan.actions[1]).value, 6u);

    GameState const next = engine.ExecuteAITurn(s);
    EXPECT_EQ(next.board.size(), 2u);
    EXPECT_EQ(Ids(next.players[0].rack), (std::vector<TileId>{7}));
}

TEST(GreedyPlanner, RearrangementExtendsRun)
{
    TurnEngine engine = MakeEngine();
    std::vector<TileSet> const board{TileSet{.id = 1, .tiles = {R(1, 3), R(2, 4), R(3, 5)}}};
    GameState const s = MakeState({R(4, 6), B(5, 9)}, board, true);

    TurnPlan const plan = PlannerFor(engine).Plan(s);
    ASSERT_EQ(plan.actions.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<RearrangeAction>(plan.actions[0]));
    EXPECT_EQ(std::get<RearrangeAction>(plan.actions[0]).from_rack, (std::vector<TileId>{4}));

    GameState const next = engine.ExecuteAITurn(s);
    ASSERT_EQ(next.board.size(), 1u);
    EXPECT_EQ(Ids(next.board[0].tiles), (std::vector<TileId>{1, 2, 3, 4}));
    EXPECT_EQ(Ids(next.players[0].rack), (std::vector<TileId>{5}));
    EXPECT_EQ(next.consecutive_passes, 0u);
}

TEST(GreedyPlanner, RearrangementCompletesGroup)
{
    TurnEngine engine = MakeEngine();
    std::vector<TileSet> const board{TileSet{.id = 1, .tiles = {R(1, 7), B(2, 7), Y(3, 7)}}};
    GameState const s = MakeState({K(4, 7), R(5, 1)}, board, true);

    GameState const next = engine.ExecuteAITurn(s);
    ASSERT_EQ(next.board.size(), 1u);
    EXPECT_EQ(next.board[0].tiles.size(), 4u);
    EXPECT_EQ(Ids(next.players[0].rack), (std::vector<TileId>{5}));
}

TEST(GreedyPlanner, LargeRackStillFindsSingleTileLayOff)
{
    // 20 tiles, none forming a set on their own, and only the red 6 fits the board
    std::vector<Tile> const rack{
        R(10, 6), R(11, 9), R(12, 12),
        B(13, 1), B(14, 4), B(15, 7), B(16, 10), B(17, 13), B(18, 1), B(19, 4),
        Y(20, 2), Y(21, 5), Y(22, 8), Y(23, 11), Y(24, 2), Y(25, 5),
        K(26, 3), K(27, 6), K(28, 9), K(29, 12)
    };
    std::vector<TileSet> const board{TileSet{.id = 1, .tiles = {R(1, 3), R(2, 4), R(3, 5)}}};

    GreedyPlanner const planner{};
    ASSERT_TRUE(planner.FindPossiblePlays(rack).empty());
    auto const re = planner.FindRearrangement(rack, board);
    ASSERT_TRUE(re.has_value());
    EXPECT_EQ(Ids(re->from_rack), (std::vector<TileId>{10}));

    TurnEngine engine = MakeEngine();
    GameState const s = MakeState(rack, board, true, {Y(60, 13)});
    GameState const next = engine.ExecuteAITurn(s);
    ASSERT_EQ(next.board.size(), 1u);
    EXPECT_EQ(Ids(next.board[0].tiles), (std::vector<TileId>{1, 2, 3, 10}));
    EXPECT_EQ(next.players[0].rack.size(), 19u);
    EXPECT_EQ(next.pool.size(), 1u);
}

TEST(GreedyPlanner, NoMoveDrawsOrPasses)
{
    TurnEngine engine = MakeEngine();
    std::vector<TileSet> const board{TileSet{.id = 1, .tiles = {R(1, 3), R(2, 4), R(3, 5)}}};

    GameState const with_pool = MakeState({B(4, 9), K(5, 1)}, board, true, {Y(6, 2)});
    TurnPlan const draw = PlannerFor(engine).Plan(with_pool);
    ASSERT_EQ(draw.actions.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<DrawAction>(draw.actions[0]));

    GameState const empty_pool = MakeState({B(4, 9), K(5, 1)}, board, true);
    TurnPlan const pass = PlannerFor(engine).Plan(empty_pool);
    ASSERT_EQ(pass.actions.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<PassAction>(pass.actions[0]));
}

TEST(GreedyPlanner, EndedGamePlansPass)
{
    GreedyPlanner planner{};
    GameState s = MakeState({R(1, 1), R(2, 2), R(3, 3)}, {}, true);
    s.game_phase = GamePhase::Ended;
    s.winner = 0;
    TurnPlan const plan = planner.Plan(s);
    ASSERT_EQ(plan.actions.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<PassAction>(plan.actions[0]));
}

TEST(AiTurn, StaleTileIdsAreSkipped)
{
    TurnEngine engine = MakeEngine(std::make_unique<ScriptedPlanner>(
        TurnPlan{{PlaySetAction{{777, 778, 779}, 30}}}));
    GameState const s = MakeState({R(1, 1), B(2, 5)});

    GameState const next = engine.ExecuteAITurn(s);
    EXPECT_TRUE(next.board.empty());
    EXPECT_EQ(Ids(next.players[0].rack), (std::vector<TileId>{1, 2}));
    EXPECT_EQ(next.consecutive_passes, 1u);
    EXPECT_EQ(next.current_player_index, 1);
}

TEST(AiTurn, InvalidPlannedSetIsSkipped)
{
    TurnEngine engine = MakeEngine(std::make_unique<ScriptedPlanner>(
        TurnPlan{{PlaySetAction{{1, 2, 3}, 15}, DrawAction{}}}));
    GameState const s = MakeState({R(1, 1), B(2, 5), K(3, 9)}, {}, true, {Y(4, 4)});

    GameState const next = engine.ExecuteAITurn(s);
    EXPECT_TRUE(next.board.empty());
    EXPECT_EQ(next.players[0].rack.size(), 4u);
    EXPECT_EQ(next.consecutive_passes, 0u);
}

TEST(AiTurn, ShortMeldFallsBackToDraw)
{
    // a planner that ignores the meld threshold; the engine refuses and draws instead
    TurnEngine engine = MakeEngine(std::make_unique<ScriptedPlanner>(
        TurnPlan{{PlaySetAction{{1, 2, 3}, 6}}}));
    GameState const s = MakeState({R(1, 1), R(2, 2), R(3, 3)}, {}, false, {Y(4, 4)});

    GameState const next = engine.ExecuteAITurn(s);
    EXPECT_TRUE(next.board.empty());
    EXPECT_EQ(next.players[0].rack.size(), 4u);
    EXPECT_FALSE(next.players[0].has_played_initial_meld);
    EXPECT_EQ(next.current_player_index, 1);
}

TEST(AiTurn, IncompleteRearrangementIsSkipped)
{
    std::vector<TileSet> const board{
        TileSet{.id = 1, .tiles = {R(1, 3), R(2, 4), R(3, 5)}},
        TileSet{.id = 2, .tiles = {B(4, 8), Y(5, 8), K(6, 8)}}
    };
    // only re-homes the first board set
    TurnEngine engine = MakeEngine(std::make_unique<ScriptedPlanner>(
        TurnPlan{{RearrangeAction{{7}, {{1, 2, 3, 7}}}}}));
    GameState const s = MakeState({R(7, 6)}, board, true);

    GameState const next = engine.ExecuteAITurn(s);
    EXPECT_EQ(next.board.size(), 2u);
    EXPECT_EQ(Ids(next.players[0].rack), (std::vector<TileId>{7}));
    EXPECT_EQ(next.consecutive_passes, 1u);
}

TEST(GreedyPlanner, UnknownSeatThrows)
{
    GreedyPlanner planner{};
    GameState s = MakeState({R(1, 1)});
    s.current_player_index = 9;
    EXPECT_THROW((void)planner.Plan(s), rummi::core::error::PlannerError);
}
