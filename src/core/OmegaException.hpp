#ifndef MESHQUIZ_OMEGAEXCEPTION_HPP
#define MESHQUIZ_OMEGAEXCEPTION_HPP

#include <exception>
#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace meshquiz::core
{
    // Carries the raising site, a backtrace and a typed payload (usually an error::Code).
    // Derives from std::exception so scheduler and transport boundaries can catch one type.
    template <typename T>
    class OmegaException : public std::exception
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
        auto what() const noexcept -> char const* override { return err_str_.c_str(); }

        [[nodiscard]]
        auto message() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            // skip the frames of the throw helpers themselves
            std::size_t const skip = backtrace_.size() > 3 ? 3 : 0;
            for (std::size_t i{skip}; i < backtrace_.size(); ++i)
            {
                s += std::format("{}({}):{}\n", backtrace_[i].source_file(), backtrace_[i].source_line(),
                                 backtrace_[i].description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

// lets std::print("{}", e) render the message, code and raising site
template <class T>
struct std::formatter<meshquiz::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(meshquiz::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {} [{}:{}]", static_cast<int>(p.data()), p.message(),
                                    p.where().file_name(), p.where().line());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //MESHQUIZ_OMEGAEXCEPTION_HPP
