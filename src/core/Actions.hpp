#ifndef RUMMIGAME_ACTIONS_HPP
#define RUMMIGAME_ACTIONS_HPP

#include "Types.hpp"

namespace rummi::core
{
    // Place one new set made only of rack tiles.
    struct PlaySetAction
    {
        std::vector<TileId> tiles;
        uint32_t value{};
    };

    // Re-partition every board tile plus some rack tiles into a new board layout.
    struct RearrangeAction
    {
        std::vector<TileId> from_rack;
        std::vector<std::vector<TileId>> layout;
    };

    struct DrawAction {};
    struct PassAction {};

    using PlayerAction = std::variant<
      PlaySetAction, RearrangeAction, DrawAction, PassAction>;

    // Draw and Pass are terminal, nothing after them is applied.
    struct TurnPlan
    {
        std::vector<PlayerAction> actions;
    };
} // namespace rummi::core

#endif //RUMMIGAME_ACTIONS_HPP
