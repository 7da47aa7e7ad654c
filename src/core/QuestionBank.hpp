#ifndef MESHQUIZ_QUESTIONBANK_HPP
#define MESHQUIZ_QUESTIONBANK_HPP

#include <cstddef>
#include <expected>
#include <istream>
#include <string>
#include <vector>

#include "Types.hpp"

namespace meshquiz::core
{
    struct QuestionParseError
    {
        size_t line{};
        std::string message;
    };

    // Question file format:
    //
    //   Q:200: What does XSS stand for?
    //   A: cross-site scripting
    //   A: cross site scripting
    //
    // Points are optional ("Q: text" is worth 100). Blank lines are ignored and a
    // question with no answer lines is dropped. Ids are assigned in file order from 1.
    auto ParseQuestions(std::istream& in) -> std::expected<std::vector<Question>, QuestionParseError>;

    // Parses `path`. A file that cannot be opened yields the built-in set with a warning.
    auto LoadQuestions(std::string const& path) -> std::expected<std::vector<Question>, QuestionParseError>;

    auto DefaultQuestions() -> std::vector<Question>;
}

#endif //MESHQUIZ_QUESTIONBANK_HPP
