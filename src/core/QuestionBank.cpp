#include "QuestionBank.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <optional>
#include <print>
#include <string_view>

#include "Util.hpp"

namespace meshquiz::core
{
    namespace
    {
        auto ParsePoints(std::string_view s) -> std::optional<Points>
        {
            s = util::Trim(s);
            if (s.empty()) return std::nullopt;
            if (s.front() == '+') s.remove_prefix(1);

            Points v{};
            auto const res = std::from_chars(s.data(), s.data() + s.size(), v);
            if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) return std::nullopt;
            return v;
        }

        auto Magnitude(Points const p) -> Points
        {
            return p < 0 ? -p : p;
        }
    }

    auto ParseQuestions(std::istream& in) -> std::expected<std::vector<Question>, QuestionParseError>
    {
        std::vector<Question> out;
        std::optional<Question> pending;

        auto const flush = [&]()
        {
            if (pending && !pending->answers.empty())
            {
                pending->id = static_cast<uint32_t>(out.size() + 1);
                out.push_back(std::move(*pending));
            }
            pending.reset();
        };

        std::string raw;
        size_t line_no{0};
        while (std::getline(in, raw))
        {
            ++line_no;
            std::string_view const line = util::Trim(raw);
            if (line.empty()) continue;

            if (line.starts_with("Q:"))
            {
                flush();
                std::string_view body = line.substr(2);
                Points value = constants::MinQuestionValue;

                // "Q:<points>: text" only when the part before the second colon is a number
                if (size_t const colon = body.find(':'); colon != std::string_view::npos)
                {
                    if (std::optional<Points> const p = ParsePoints(body.substr(0, colon)))
                    {
                        if (Magnitude(*p) < constants::MinQuestionValue || Magnitude(*p) > constants::MaxQuestionValue)
                        {
                            return std::unexpected(QuestionParseError{
                                line_no,
                                std::format("point value {} outside {}..{}", *p,
                                            constants::MinQuestionValue, constants::MaxQuestionValue)
                            });
                        }
                        value = *p;
                        body = body.substr(colon + 1);
                    }
                }

                body = util::Trim(body);
                if (body.empty())
                {
                    return std::unexpected(QuestionParseError{line_no, "question without text"});
                }
                pending = Question{.prompt = std::string(body), .value = value};
            }
            else if (line.starts_with("A:"))
            {
                if (!pending)
                {
                    return std::unexpected(QuestionParseError{line_no, "answer before any question"});
                }
                std::string_view const ans = util::Trim(line.substr(2));
                if (!ans.empty()) pending->answers.emplace_back(ans);
            }
            // anything else is a comment line
        }
        flush();
        return out;
    }

    auto LoadQuestions(std::string const& path) -> std::expected<std::vector<Question>, QuestionParseError>
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            std::print("[Questions] WARNING: {} not found, using the built-in questions\n", path);
            return DefaultQuestions();
        }
        return ParseQuestions(in);
    }

    auto DefaultQuestions() -> std::vector<Question>
    {
        return {
            Question{.id = 1, .prompt = "What port does SSH use by default?", .value = 100,
                     .answers = {"22", "twenty-two"}},
            Question{.id = 2, .prompt = "What does XSS stand for?", .value = 200,
                     .answers = {"cross-site scripting", "cross site scripting"}},
            Question{.id = 3, .prompt = "What is the default port for HTTPS?", .value = 100,
                     .answers = {"443", "four forty-three"}},
        };
    }
}
