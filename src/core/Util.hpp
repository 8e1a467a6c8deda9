#ifndef RUMMIGAME_UTIL_HPP
#define RUMMIGAME_UTIL_HPP

#include <algorithm>
#include <iterator>
#include <span>
#include <memory>
#include <optional>
#include <utility>
#include "Types.hpp"

namespace rummi::core
{
    // Source of tile and set identities. Injected so tests can predict every id.
    class IdSource
    {
    public:
        virtual ~IdSource() = default;
        virtual auto Next() -> std::uint32_t = 0;
    };

    class SequentialIdSource final : public IdSource
    {
    public:
        explicit SequentialIdSource(std::uint32_t first = 0) : next_(first) {}

        auto Next() -> std::uint32_t override { return next_++; }

    private:
        std::uint32_t next_;
    };
}

namespace rummi::core::util
{
    // 0..51 for suited tiles (suit-major), 52 for jokers
    inline auto TileKindUID(Tile const& t) -> std::uint64_t
    {
        if (t.is_joker) return constants::TileKindCount - 1;
        return static_cast<std::uint64_t>(t.color) * constants::MaxNumber + (t.number - 1u);
    }

    // Detects two suited tiles of the same kind. Jokers are ignored, the two jokers are interchangeable.
    class TileUniqueChecker
    {
    public:
        TileUniqueChecker():
            kinds_(0), contains_dup_(false) {}
        auto Add(Tile const& t) -> void
        {
            if (t.is_joker) return;
            std::uint64_t const kind = std::uint64_t{1} << TileKindUID(t);
            contains_dup_ |= static_cast<bool>(kinds_ & kind);
            kinds_ |= kind;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
    private:
        std::uint64_t kinds_;
        bool contains_dup_;
    };

    inline auto ContainsId(std::span<Tile const> tiles, TileId const id) -> bool
    {
        return std::ranges::any_of(tiles, [id](Tile const& t) { return t.id == id; });
    }

    inline auto ContainsId(std::span<TileId const> ids, TileId const id) -> bool
    {
        return std::ranges::find(ids, id) != ids.end();
    }

    inline auto FindById(std::span<Tile const> tiles, TileId const id) -> std::optional<Tile>
    {
        auto const it = std::ranges::find_if(tiles, [id](Tile const& t) { return t.id == id; });
        return (it != tiles.end()) ? std::optional<Tile>{*it} : std::nullopt;
    }

    // Erases every tile whose id is listed; returns how many were erased.
    inline auto EraseIds(std::vector<Tile>& tiles, std::span<TileId const> ids) -> std::size_t
    {
        return std::erase_if(tiles, [&ids](Tile const& t) { return ContainsId(ids, t.id); });
    }

    inline auto IdsOf(std::span<Tile const> tiles) -> std::vector<TileId>
    {
        std::vector<TileId> ids;
        ids.reserve(tiles.size());
        std::ranges::transform(tiles, std::back_inserter(ids), [](Tile const& t) { return t.id; });
        return ids;
    }
}

#endif //RUMMIGAME_UTIL_HPP
