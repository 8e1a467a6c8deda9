#include "GreedyPlanner.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <numeric>
#include <ranges>
#include <utility>

#include "Exception.hpp"
#include "Sorter.hpp"
#include "Util.hpp"

namespace
{
    using rummi::core::Tile;

    // Visits the k-subsets of {0..n-1} in lexicographic order until visit returns false.
    template <typename Fn>
    auto ForEachCombination(std::size_t const n, std::size_t const k, Fn&& visit) -> void
    {
        if (k == 0 || k > n) return;
        std::vector<std::size_t> idx(k);
        std::iota(idx.begin(), idx.end(), std::size_t{0});
        for (;;)
        {
            if (!visit(std::span<std::size_t const>{idx})) return;

            std::size_t i = k;
            while (i > 0 && idx[i - 1] == n - k + i - 1) --i;
            if (i == 0) return;
            ++idx[i - 1];
            for (std::size_t j = i; j < k; ++j) idx[j] = idx[j - 1] + 1;
        }
    }

    auto Pick(std::span<Tile const> from, std::span<std::size_t const> idx) -> std::vector<Tile>
    {
        std::vector<Tile> out;
        out.reserve(idx.size());
        for (std::size_t const i : idx) out.push_back(from[i]);
        return out;
    }

    auto Flatten(std::span<rummi::core::TileSet const> board) -> std::vector<Tile>
    {
        std::vector<Tile> out;
        for (auto const& set : board)
        {
            out.insert(out.end(), set.tiles.begin(), set.tiles.end());
        }
        return out;
    }

    // First tile of each suit for `number`, in suit order.
    auto DistinctSuits(std::span<Tile const> tiles, std::uint8_t const number) -> std::vector<Tile>
    {
        std::vector<Tile> out;
        for (auto const color : rummi::core::Suits)
        {
            auto const it = std::ranges::find_if(tiles, [&](Tile const& t)
            {
                return !t.is_joker && t.color == color && t.number == number;
            });
            if (it != tiles.end()) out.push_back(*it);
        }
        return out;
    }

    // First tile of each number of `color`, ascending.
    auto DistinctNumbers(std::span<Tile const> tiles, rummi::core::Color const color) -> std::vector<Tile>
    {
        std::vector<Tile> out;
        for (std::uint8_t n{rummi::core::constants::MinNumber}; n <= rummi::core::constants::MaxNumber; ++n)
        {
            auto const it = std::ranges::find_if(tiles, [&](Tile const& t)
            {
                return !t.is_joker && t.color == color && t.number == n;
            });
            if (it != tiles.end()) out.push_back(*it);
        }
        return out;
    }

    auto ExtractGroups(std::vector<Tile>& remaining, std::vector<std::vector<Tile>>& sets) -> void
    {
        using namespace rummi::core;
        for (std::uint8_t n{constants::MinNumber}; n <= constants::MaxNumber; ++n)
        {
            for (;;)
            {
                std::vector<Tile> group = DistinctSuits(remaining, n);
                if (group.size() < constants::MinSetSize) break;
                util::EraseIds(remaining, util::IdsOf(group));
                sets.push_back(std::move(group));
            }
        }
    }

    auto ExtractRuns(std::vector<Tile>& remaining, std::vector<std::vector<Tile>>& sets) -> void
    {
        using namespace rummi::core;
        for (Color const color : Suits)
        {
            for (;;)
            {
                std::vector<Tile> const distinct = DistinctNumbers(remaining, color);

                // first maximal stretch of consecutive numbers
                std::optional<std::pair<std::size_t, std::size_t>> segment;
                std::size_t seg_start{};
                for (std::size_t i{1}; i <= distinct.size(); ++i)
                {
                    bool const breaks = (i == distinct.size()) ||
                                        (distinct[i].number != distinct[i - 1].number + 1);
                    if (!breaks) continue;
                    if (i - seg_start >= constants::MinSetSize)
                    {
                        segment = std::pair{seg_start, i};
                        break;
                    }
                    seg_start = i;
                }
                if (!segment) break;

                std::vector<Tile> run(distinct.begin() + static_cast<std::ptrdiff_t>(segment->first),
                                      distinct.begin() + static_cast<std::ptrdiff_t>(segment->second));
                util::EraseIds(remaining, util::IdsOf(run));
                sets.push_back(std::move(run));
            }
        }
    }

    auto ToIds(std::vector<std::vector<Tile>> const& layout) -> std::vector<std::vector<rummi::core::TileId>>
    {
        std::vector<std::vector<rummi::core::TileId>> out;
        out.reserve(layout.size());
        for (auto const& set : layout) out.push_back(rummi::core::util::IdsOf(set));
        return out;
    }
}

namespace rummi::core
{
    GreedyPlanner::GreedyPlanner(PlannerLimits limits):
        limits_(limits) {}

    auto GreedyPlanner::Plan(GameState const& snapshot) -> TurnPlan
    {
        if (snapshot.current_player_index >= snapshot.players.size())
            RMI_THROW(error::Code::Planner, "Planner asked to plan for a seat that does not exist");
        if (snapshot.game_phase == GamePhase::Ended) return TurnPlan{{PassAction{}}};

        Player const& me = snapshot.players[snapshot.current_player_index];
        if (!me.has_played_initial_meld)
        {
            return PlanInitialMeld(snapshot);
        }
        return PlanRegularTurn(snapshot);
    }

    static auto DrawOrPass(GameState const& s) -> TurnPlan
    {
        if (s.pool.empty()) return TurnPlan{{PassAction{}}};
        return TurnPlan{{DrawAction{}}};
    }

    auto GreedyPlanner::PlanInitialMeld(GameState const& s) const -> TurnPlan
    {
        std::vector<Tile> rack = s.players[s.current_player_index].rack;
        TurnPlan plan{};
        std::uint32_t total{};

        for (std::uint8_t i{}; i < limits_.premeld_iterations && !rack.empty(); ++i)
        {
            std::vector<PossiblePlay> const plays = FindPossiblePlays(rack);
            if (plays.empty()) break;

            PossiblePlay const& best = plays.front();
            std::vector<TileId> ids = util::IdsOf(best.tiles);
            util::EraseIds(rack, ids);
            total += best.value;
            plan.actions.emplace_back(PlaySetAction{std::move(ids), best.value});
        }

        if (total >= constants::InitialMeldThreshold) return plan;

        // Below the threshold nothing goes on the board: the tentative sets are dropped and we draw.
        return DrawOrPass(s);
    }

    auto GreedyPlanner::PlanRegularTurn(GameState const& s) const -> TurnPlan
    {
        std::vector<Tile> rack = s.players[s.current_player_index].rack;
        std::vector<TileSet> board = s.board;
        TurnPlan plan{};

        // rearranging is the fallback for turns that start without any direct play
        bool const may_rearrange = FindPossiblePlays(rack).empty();
        std::uint8_t rounds{};

        for (std::size_t step{}; step <= limits_.follow_up_depth && !rack.empty(); ++step)
        {
            std::vector<PossiblePlay> const plays = FindPossiblePlays(rack);
            if (!plays.empty())
            {
                PossiblePlay const& best = plays.front();
                bool const on_rack = std::ranges::all_of(best.tiles, [&rack](Tile const& t)
                {
                    return util::ContainsId(rack, t.id);
                });
                if (!on_rack) break;

                std::vector<TileId> ids = util::IdsOf(best.tiles);
                util::EraseIds(rack, ids);
                board.push_back(TileSet{.id = 0, .tiles = best.tiles});
                plan.actions.emplace_back(PlaySetAction{std::move(ids), best.value});
                continue;
            }

            if (!may_rearrange || rounds >= limits_.rearrange_rounds) break;

            std::optional<Rearrangement> re = FindRearrangement(rack, board);
            if (!re) break;
            ++rounds;

            std::vector<TileId> from_rack = util::IdsOf(re->from_rack);
            util::EraseIds(rack, from_rack);
            board.clear();
            for (auto& set : re->layout) board.push_back(TileSet{.id = 0, .tiles = set});
            plan.actions.emplace_back(RearrangeAction{std::move(from_rack), ToIds(re->layout)});
        }

        if (plan.actions.empty()) return DrawOrPass(s);
        return plan;
    }

    auto GreedyPlanner::AddCandidate(std::vector<Tile> tiles, std::vector<PossiblePlay>& out) const -> void
    {
        SetCheck const check = rules_.Classify(tiles);
        if (!check.IsValid()) return;
        if (check.kind == SetKind::Run) tiles = rules_.ArrangeRun(tiles);
        out.push_back(PossiblePlay{.tiles = std::move(tiles), .value = check.value, .kind = check.kind});
    }

    auto GreedyPlanner::FindPossibleRuns(std::span<Tile const> rack, std::vector<PossiblePlay>& out) const -> void
    {
        std::vector<Tile> jokers;
        std::ranges::copy_if(rack, std::back_inserter(jokers), &Tile::is_joker);
        std::size_t const max_jokers = std::min<std::size_t>(jokers.size(), constants::JokerCount);

        for (Color const color : Suits)
        {
            // a second copy of a number can never join the same run
            std::vector<Tile> const distinct = DistinctNumbers(rack, color);
            std::size_t const n = distinct.size();

            // windows of two suited tiles still make a run with a joker
            for (std::size_t start{}; start < n; ++start)
            {
                for (std::size_t end = start + 2; end <= n; ++end)
                {
                    for (std::size_t jc{}; jc <= max_jokers; ++jc)
                    {
                        std::vector<Tile> candidate(distinct.begin() + static_cast<std::ptrdiff_t>(start),
                                                    distinct.begin() + static_cast<std::ptrdiff_t>(end));
                        candidate.insert(candidate.end(), jokers.begin(),
                                         jokers.begin() + static_cast<std::ptrdiff_t>(jc));
                        if (!ClassicRules::AnalyseRun(candidate)) continue;
                        AddCandidate(std::move(candidate), out);
                    }
                }
            }
        }
    }

    auto GreedyPlanner::FindPossibleGroups(std::span<Tile const> rack, std::vector<PossiblePlay>& out) const -> void
    {
        std::vector<Tile> jokers;
        std::ranges::copy_if(rack, std::back_inserter(jokers), &Tile::is_joker);
        std::size_t const max_jokers = std::min<std::size_t>(jokers.size(), constants::JokerCount);

        // ordered by number so the result never depends on hashing
        std::map<std::uint8_t, std::vector<Tile>> by_number;
        for (Tile const& t : rack)
        {
            if (!t.is_joker && !by_number.contains(t.number))
                by_number.emplace(t.number, DistinctSuits(rack, t.number));
        }

        for (auto const& [number, distinct] : by_number)
        {
            (void)number;
            for (std::size_t size{constants::MinSetSize}; size <= constants::MaxGroupSize; ++size)
            {
                ForEachCombination(distinct.size(), size, [&](std::span<std::size_t const> idx)
                {
                    AddCandidate(Pick(distinct, idx), out);
                    return true;
                });
            }

            for (std::size_t jc{1}; jc <= max_jokers; ++jc)
            {
                for (std::size_t suited{1}; suited < constants::MaxGroupSize; ++suited)
                {
                    std::size_t const total = suited + jc;
                    if (total < constants::MinSetSize || total > constants::MaxGroupSize) continue;
                    ForEachCombination(distinct.size(), suited, [&](std::span<std::size_t const> idx)
                    {
                        std::vector<Tile> candidate = Pick(distinct, idx);
                        candidate.insert(candidate.end(), jokers.begin(),
                                         jokers.begin() + static_cast<std::ptrdiff_t>(jc));
                        AddCandidate(std::move(candidate), out);
                        return true;
                    });
                }
            }
        }
    }

    auto GreedyPlanner::FindPossiblePlays(std::span<Tile const> rack) const -> std::vector<PossiblePlay>
    {
        std::vector<PossiblePlay> plays;
        FindPossibleRuns(rack, plays);
        FindPossibleGroups(rack, plays);
        std::ranges::stable_sort(plays, std::greater<>{}, &PossiblePlay::value);
        return plays;
    }

    auto GreedyPlanner::FindRearrangement(std::span<Tile const> rack,
                                          std::span<TileSet const> board) const -> std::optional<Rearrangement>
    {
        std::vector<Tile> const board_tiles = Flatten(board);
        std::uint32_t explored{};
        bool exhausted = false;

        // Sizes 1 and 2 (laying one or two tiles off) are always searched in full. The larger sizes
        // share rearrange_total evenly, so a big rack cannot spend it all before reaching the small ones.
        std::size_t const capped_sizes = rack.size() > 2 ? rack.size() - 2 : 0;
        std::uint32_t const share = capped_sizes == 0 ? 0 : std::max<std::uint32_t>(
            1, static_cast<std::uint32_t>(limits_.rearrange_total / capped_sizes));
        std::uint32_t const per_size_cap = std::min(limits_.rearrange_per_size, share);

        for (std::size_t size = rack.size(); size > 0; --size)
        {
            bool const exhaustive = size <= 2;
            if (exhausted && !exhaustive) continue;

            std::uint32_t per_size{};
            std::optional<Rearrangement> found;

            ForEachCombination(rack.size(), size, [&](std::span<std::size_t const> idx)
            {
                if (!exhaustive)
                {
                    if (explored >= limits_.rearrange_total)
                    {
                        exhausted = true;
                        return false;
                    }
                    if (per_size >= per_size_cap) return false;
                    ++explored;
                    ++per_size;
                }

                std::vector<Tile> subset = Pick(rack, idx);
                std::vector<Tile> pool = board_tiles;
                pool.insert(pool.end(), subset.begin(), subset.end());

                if (auto layout = Partition(pool))
                {
                    found = Rearrangement{.from_rack = std::move(subset), .layout = std::move(*layout)};
                    return false;
                }
                return true;
            });

            if (found) return found;
        }
        return std::nullopt;
    }

    auto GreedyPlanner::Partition(std::span<Tile const> tiles) const -> std::optional<std::vector<std::vector<Tile>>>
    {
        if (auto sets = PartitionWith(tiles, PassOrder::GroupsThenRuns)) return sets;
        return PartitionWith(tiles, PassOrder::RunsThenGroups);
    }

    auto GreedyPlanner::PartitionWith(std::span<Tile const> tiles, PassOrder const order) const
        -> std::optional<std::vector<std::vector<Tile>>>
    {
        std::vector<Tile> remaining = SortRack({tiles.begin(), tiles.end()});
        std::vector<std::vector<Tile>> sets;

        if (order == PassOrder::GroupsThenRuns)
        {
            ExtractGroups(remaining, sets);
            ExtractRuns(remaining, sets);
        }
        else
        {
            ExtractRuns(remaining, sets);
            ExtractGroups(remaining, sets);
        }

        // leftovers that still form sets of their own, usually with a joker
        for (;;)
        {
            std::vector<PossiblePlay> const plays = FindPossiblePlays(remaining);
            if (plays.empty()) break;
            util::EraseIds(remaining, util::IdsOf(plays.front().tiles));
            sets.push_back(plays.front().tiles);
        }

        AbsorbLeftovers(remaining, sets);
        if (!remaining.empty()) return std::nullopt;

        for (auto& set : sets)
        {
            if (!rules_.IsValidSet(set)) return std::nullopt;
            set = rules_.Arrange(set);
        }
        return sets;
    }

    auto GreedyPlanner::AbsorbLeftovers(std::vector<Tile>& remaining, std::vector<std::vector<Tile>>& sets) const
        -> void
    {
        bool progress = true;
        while (progress && !remaining.empty())
        {
            progress = false;
            for (std::size_t i{}; i < remaining.size() && !progress; ++i)
            {
                for (auto& set : sets)
                {
                    std::vector<Tile> candidate = set;
                    candidate.push_back(remaining[i]);
                    if (!rules_.IsValidSet(candidate)) continue;

                    set = rules_.Arrange(candidate);
                    remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(i));
                    progress = true;
                    break;
                }
            }
        }
    }
}
