#ifndef MESHQUIZ_UTIL_HPP
#define MESHQUIZ_UTIL_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace meshquiz::core::util
{
    inline auto IsSpace(char const c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline auto Trim(std::string_view s) -> std::string_view
    {
        while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
        while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
        return s;
    }

    // ASCII fold only; answers and commands are plain ASCII on the mesh
    inline auto ToLower(std::string_view s) -> std::string
    {
        std::string out(s);
        std::ranges::transform(out, out.begin(),
                               [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
        return out;
    }

    inline auto NormalizeAnswer(std::string_view s) -> std::string
    {
        return ToLower(Trim(s));
    }

    // "ban !abcd" -> {"ban", "!abcd"}
    inline auto SplitFirstWord(std::string_view s) -> std::pair<std::string_view, std::string_view>
    {
        s = Trim(s);
        auto const it = std::ranges::find_if(s, IsSpace);
        auto const n = static_cast<size_t>(it - s.begin());
        return {s.substr(0, n), Trim(s.substr(n))};
    }

    // HH:MM:SS wall clock for log lines
    inline auto Stamp() -> std::string
    {
        std::time_t const t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&t, &tm);
        return std::format("{:02}:{:02}:{:02}", tm.tm_hour, tm.tm_min, tm.tm_sec);
    }
}

#endif //MESHQUIZ_UTIL_HPP
