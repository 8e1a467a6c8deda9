#include "ClassicRules.hpp"

#include "Util.hpp"
#include <ranges>
#include <algorithm>

namespace rummi::core
{
    static auto InRange(Tile const& t) -> bool
    {
        return t.number >= constants::MinNumber && t.number <= constants::MaxNumber;
    }

    // Suited tiles sorted by number, jokers in input order.
    static auto SplitJokers(std::span<Tile const> tiles) -> std::pair<std::vector<Tile>, std::vector<Tile>>
    {
        std::vector<Tile> suited;
        std::vector<Tile> jokers;
        for (Tile const& t : tiles)
        {
            (t.is_joker ? jokers : suited).push_back(t);
        }
        std::ranges::stable_sort(suited, {}, &Tile::number);
        return {std::move(suited), std::move(jokers)};
    }

    auto ClassicRules::AnalyseRun(std::span<Tile const> tiles) -> std::optional<RunShape>
    {
        if (tiles.size() < constants::MinSetSize) return std::nullopt;

        auto const [suited, jokers] = SplitJokers(tiles);
        if (suited.empty()) return std::nullopt;

        Color const color = suited.front().color;
        util::TileUniqueChecker checker{};
        for (Tile const& t : suited)
        {
            if (t.color != color || !InRange(t)) return std::nullopt;
            checker.Add(t);
        }
        // a literal duplicate can never sit in a run, whatever the jokers do
        if (checker.ContainsDup()) return std::nullopt;

        std::size_t gaps_needed{};
        for (std::size_t i{1}; i < suited.size(); ++i)
        {
            gaps_needed += suited[i].number - suited[i - 1].number - 1u;
        }
        if (gaps_needed > jokers.size()) return std::nullopt;

        std::size_t const to_extend = jokers.size() - gaps_needed;
        std::uint8_t const start = suited.front().number;
        std::uint8_t const end = suited.back().number;

        std::size_t const max_before = start - constants::MinNumber;
        std::size_t const max_after = constants::MaxNumber - end;
        if (to_extend > max_before + max_after) return std::nullopt;

        std::size_t const base_length = end - start + 1u;
        if (base_length + to_extend != tiles.size()) return std::nullopt;

        // lower numbers first: {7, 8, joker} is 6-7-8, only a run starting at 1 extends upwards
        std::size_t const before = std::min(to_extend, max_before);
        return RunShape{
            .start = start,
            .end = end,
            .extend_before = static_cast<std::uint8_t>(before),
            .extend_after = static_cast<std::uint8_t>(to_extend - before)
        };
    }

    auto ClassicRules::IsValidRun(std::span<Tile const> tiles) const -> bool
    {
        return AnalyseRun(tiles).has_value();
    }

    auto ClassicRules::IsValidGroup(std::span<Tile const> tiles) const -> bool
    {
        if (tiles.size() < constants::MinSetSize || tiles.size() > constants::MaxGroupSize) return false;

        auto suited = tiles | std::views::filter([](Tile const& t) { return !t.is_joker; });
        if (std::ranges::empty(suited)) return false;

        std::uint8_t const number = std::ranges::begin(suited)->number;
        util::TileUniqueChecker checker{};
        for (Tile const& t : suited)
        {
            if (t.number != number || !InRange(t) || t.color == Color::Joker) return false;
            checker.Add(t);
        }
        // same number, so a repeated kind is a repeated suit; jokers only fill missing suits
        return !checker.ContainsDup();
    }

    auto ClassicRules::Classify(std::span<Tile const> tiles) const -> SetCheck
    {
        if (auto const shape = AnalyseRun(tiles))
        {
            std::uint32_t const lo = shape->start - shape->extend_before;
            std::uint32_t const hi = shape->end + shape->extend_after;
            return {SetKind::Run, (lo + hi) * (hi - lo + 1u) / 2u};
        }
        if (IsValidGroup(tiles))
        {
            auto const it = std::ranges::find_if(tiles, [](Tile const& t) { return !t.is_joker; });
            // jokers take the group's number
            return {SetKind::Group, static_cast<std::uint32_t>(it->number * tiles.size())};
        }
        return {};
    }

    auto ClassicRules::ArrangeRun(std::span<Tile const> tiles) const -> std::vector<Tile>
    {
        auto const shape = AnalyseRun(tiles);
        if (!shape) return {tiles.begin(), tiles.end()};

        auto const [suited, jokers] = SplitJokers(tiles);
        std::vector<Tile> arranged;
        arranged.reserve(tiles.size());

        auto next_joker = jokers.cbegin();
        for (std::uint8_t i{}; i < shape->extend_before; ++i)
        {
            arranged.push_back(*next_joker++);
        }

        auto next_suited = suited.cbegin();
        for (std::uint8_t n = shape->start; n <= shape->end; ++n)
        {
            if (next_suited != suited.cend() && next_suited->number == n)
                arranged.push_back(*next_suited++);
            else
                arranged.push_back(*next_joker++);
        }

        for (std::uint8_t i{}; i < shape->extend_after; ++i)
        {
            arranged.push_back(*next_joker++);
        }
        return arranged;
    }

    auto ClassicRules::RackValuation(std::span<Tile const> rack) const -> std::uint32_t
    {
        std::uint32_t total{};
        for (Tile const& t : rack)
        {
            total += t.is_joker ? constants::JokerPenalty : t.number;
        }
        return total;
    }
} // rummi
