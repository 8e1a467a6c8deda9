#ifndef RUMMIGAME_PLANNER_HPP
#define RUMMIGAME_PLANNER_HPP

#include "Actions.hpp"
#include "State.hpp"

namespace rummi::core
{
    class Planner
    {
    public:
        virtual ~Planner() = default;

        // Called once per computer turn on the state as it stands at turn start.
        // The returned plan is applied by the engine through the same primitives a human uses.
        virtual auto Plan(GameState const& snapshot) -> TurnPlan = 0;
    };
}
#endif //RUMMIGAME_PLANNER_HPP
