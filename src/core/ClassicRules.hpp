#ifndef RUMMIGAME_CLASSICRULES_HPP
#define RUMMIGAME_CLASSICRULES_HPP
#include <optional>
#include "Rules.hpp"

namespace rummi::core
{
    class ClassicRules final : public Rules
    {
    public:
        // Where the jokers of a run go: extend_before jokers below start, extend_after above end,
        // the rest fill the gaps between start and end.
        struct RunShape
        {
            std::uint8_t start{};
            std::uint8_t end{};
            std::uint8_t extend_before{};
            std::uint8_t extend_after{};
        };

        auto IsValidRun(std::span<Tile const> tiles) const -> bool override;
        auto IsValidGroup(std::span<Tile const> tiles) const -> bool override;
        auto Classify(std::span<Tile const> tiles) const -> SetCheck override;
        auto ArrangeRun(std::span<Tile const> tiles) const -> std::vector<Tile> override;
        auto RackValuation(std::span<Tile const> rack) const -> std::uint32_t override;

        static auto AnalyseRun(std::span<Tile const> tiles) -> std::optional<RunShape>;
    };
}

#endif //RUMMIGAME_CLASSICRULES_HPP
