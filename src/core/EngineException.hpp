#ifndef TYCOON_ENGINEEXCEPTION_HPP
#define TYCOON_ENGINEEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace tycoon::core
{
    // Thrown only for engine defects (broken invariants, misuse of internals).
    // Ordinary rule violations travel as std::expected values instead.
    template <typename T>
    class EngineException
    {
    public:
        EngineException(std::string err_str,
                        T code,
                        std::source_location const& src_loc = std::source_location::current(),
                        std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            code_{std::move(code)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto code() const noexcept -> T const& { return code_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            // the innermost frames belong to the throw machinery itself
            std::size_t const skip = backtrace_.size() > 3 ? 3 : 0;
            for (auto it = backtrace_.begin(); it != (backtrace_.end() - skip); ++it)
            {
                s += std::format("{}({}):{}\n", it->source_file(), it->source_line(), it->description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T code_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

template <class T>
struct std::formatter<tycoon::core::EngineException<T>> : std::formatter<std::string_view>
{
    constexpr auto parse(std::format_parse_context& ctx)
    {
        return std::formatter<std::string_view>::parse(ctx);
    }

    template <class FormatContext>
    auto format(tycoon::core::EngineException<T> const& e, FormatContext& ctx) const
    {
        std::string s = std::format("Engine defect ({}): {}\n{}\n", static_cast<int>(e.code()), e.what(),
                                    e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //TYCOON_ENGINEEXCEPTION_HPP
