#ifndef RUMMIGAME_RECORDINGPLANNER_HPP
#define RUMMIGAME_RECORDINGPLANNER_HPP

#include <memory>
#include <utility>

#include "../core/Planner.hpp"

namespace rummi::core::debug
{
    class RecordingPlanner final : public Planner
    {
    public:
        explicit RecordingPlanner(std::unique_ptr<Planner> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Plan(GameState const& snapshot) -> TurnPlan override
        {
            last_plan_ = inner_->Plan(snapshot);
            has_last_ = true;
            return last_plan_;
        }

        auto HasLast() const -> bool
        {
            return has_last_;
        }

        auto Last() const -> TurnPlan const&
        {
            return last_plan_;
        }

    private:
        std::unique_ptr<Planner> inner_;
        TurnPlan last_plan_{};
        bool has_last_{false};
    };

    // Downcast helper (only safe if the engine was built with a RecordingPlanner)
    inline auto AsRecording(Planner* p) -> RecordingPlanner*
    {
        return dynamic_cast<RecordingPlanner*>(p);
    }
} // namespace rummi::core::debug

#endif //RUMMIGAME_RECORDINGPLANNER_HPP
