#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "../core/QuestionBank.hpp"

using namespace meshquiz::core;

namespace
{
    auto Parse(std::string const& text)
    {
        std::istringstream in(text);
        return ParseQuestions(in);
    }
}

TEST(QuestionBank, ParsesPointsAndAnswers)
{
    auto const qs = Parse(
        "# hacker trivia\n"
        "Q:200: What does XSS stand for?\n"
        "A: cross-site scripting\n"
        "A:  Cross Site Scripting  \n"
        "\n"
        "Q: What port does SSH use?\n"
        "A: 22\n");

    ASSERT_TRUE(qs.has_value()) << qs.error().message;
    ASSERT_EQ(qs->size(), 2u);

    EXPECT_EQ((*qs)[0].id, 1u);
    EXPECT_EQ((*qs)[0].value, 200);
    EXPECT_EQ((*qs)[0].prompt, "What does XSS stand for?");
    ASSERT_EQ((*qs)[0].answers.size(), 2u);
    EXPECT_EQ((*qs)[0].answers[1], "Cross Site Scripting");

    EXPECT_EQ((*qs)[1].id, 2u);
    EXPECT_EQ((*qs)[1].value, 100); // no points given
}

TEST(QuestionBank, ColonInPromptIsNotPoints)
{
    auto const qs = Parse("Q: Expand this: TLS\nA: transport layer security\n");
    ASSERT_TRUE(qs.has_value());
    ASSERT_EQ(qs->size(), 1u);
    EXPECT_EQ((*qs)[0].prompt, "Expand this: TLS");
    EXPECT_EQ((*qs)[0].value, 100);
}

TEST(QuestionBank, SignedPointsWithinRange)
{
    auto const qs = Parse("Q:-300: Trick question\nA: yes\nQ:+500: Big one\nA: no\n");
    ASSERT_TRUE(qs.has_value());
    EXPECT_EQ((*qs)[0].value, -300);
    EXPECT_EQ((*qs)[1].value, 500);
}

TEST(QuestionBank, QuestionsWithoutAnswersAreDropped)
{
    auto const qs = Parse("Q: orphan\nQ: kept\nA: yes\nQ: orphan too\n");
    ASSERT_TRUE(qs.has_value());
    ASSERT_EQ(qs->size(), 1u);
    EXPECT_EQ((*qs)[0].prompt, "kept");
    EXPECT_EQ((*qs)[0].id, 1u);
}

TEST(QuestionBank, ErrorsCarryTheLineNumber)
{
    auto const range = Parse("Q: fine\nA: ok\nQ:900: too rich\nA: x\n");
    ASSERT_FALSE(range.has_value());
    EXPECT_EQ(range.error().line, 3u);

    auto const stray = Parse("\nA: answer first\n");
    ASSERT_FALSE(stray.has_value());
    EXPECT_EQ(stray.error().line, 2u);

    auto const empty = Parse("Q:200:   \n");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().line, 1u);
}

TEST(QuestionBank, MissingFileFallsBackToBuiltins)
{
    auto const qs = LoadQuestions("_artifacts/definitely_missing_questions.txt");
    ASSERT_TRUE(qs.has_value());
    EXPECT_EQ(qs->size(), DefaultQuestions().size());
    EXPECT_FALSE(DefaultQuestions().empty());
    for (Question const& q : DefaultQuestions())
    {
        EXPECT_FALSE(q.answers.empty());
    }
}
