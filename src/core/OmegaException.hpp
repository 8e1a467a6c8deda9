#ifndef RUMMIGAME_OMEGAEXCEPTION_HPP
#define RUMMIGAME_OMEGAEXCEPTION_HPP

#include <algorithm>
#include <cstddef>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>

namespace rummi::core
{
    // Base of every engine exception: a code, the throw site and the stack at the throw site.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        // Message, throw site, then at most max_frames frames of the stack.
        [[nodiscard]]
        auto to_str(std::size_t const max_frames = 24) const -> std::string
        {
            std::string s = std::format("{}\n  at {}:{} in `{}`\n", err_str_, src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.function_name());
            // the last frames belong to the runtime (main/_start)
            std::size_t const own = backtrace_.size() > 3 ? backtrace_.size() - 3 : backtrace_.size();
            std::size_t const shown = std::min(own, max_frames);
            for (std::size_t i{}; i < shown; ++i)
            {
                auto const& frame = backtrace_[i];
                s += std::format("  #{} {}({}): {}\n", i, frame.source_file(), frame.source_line(), frame.description());
            }
            if (shown < own) s += std::format("  ... {} more\n", own - shown);
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

template <class T>
struct std::formatter<rummi::core::OmegaException<T>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(rummi::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("[rummi] engine failure, code {}: {}", static_cast<int>(p.data()), p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //RUMMIGAME_OMEGAEXCEPTION_HPP
