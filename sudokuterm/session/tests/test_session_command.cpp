#include "session_command.h"

#include "gtest/gtest.h"

TEST(session_command, test_full_names)
{
    EXPECT_EQ(parseCommand("quit")->type, CommandType::Quit);
    EXPECT_EQ(parseCommand("check")->type, CommandType::Check);
    EXPECT_EQ(parseCommand("solve")->type, CommandType::Solve);
    EXPECT_EQ(parseCommand("reset")->type, CommandType::Reset);

    const auto hard = parseCommand("hard");
    ASSERT_TRUE(hard.has_value());
    EXPECT_EQ(hard->type, CommandType::NewGame);
    EXPECT_EQ(hard->difficulty, Difficulty::Hard);
    EXPECT_EQ(parseCommand("easy")->difficulty, Difficulty::Easy);
    EXPECT_EQ(parseCommand("medium")->difficulty, Difficulty::Medium);
}

TEST(session_command, test_prefixes)
{
    EXPECT_EQ(parseCommand("q")->type, CommandType::Quit);
    EXPECT_EQ(parseCommand("c")->type, CommandType::Check);
    EXPECT_EQ(parseCommand("s")->type, CommandType::Solve);
    EXPECT_EQ(parseCommand("r")->type, CommandType::Reset);
    EXPECT_EQ(parseCommand("e")->difficulty, Difficulty::Easy);
    EXPECT_EQ(parseCommand("m")->difficulty, Difficulty::Medium);
    EXPECT_EQ(parseCommand("ha")->difficulty, Difficulty::Hard);
}

TEST(session_command, test_colon_case_and_whitespace)
{
    EXPECT_EQ(parseCommand(":q")->type, CommandType::Quit);
    EXPECT_EQ(parseCommand("  :Quit ")->type, CommandType::Quit);
    EXPECT_EQ(parseCommand("SOLVE")->type, CommandType::Solve);
    EXPECT_EQ(parseCommand("\tcheck\n")->type, CommandType::Check);
}

TEST(session_command, test_unknown)
{
    EXPECT_FALSE(parseCommand("").has_value());
    EXPECT_FALSE(parseCommand("   ").has_value());
    EXPECT_FALSE(parseCommand(":").has_value());
    EXPECT_FALSE(parseCommand("quitt").has_value());
    EXPECT_FALSE(parseCommand("undo").has_value());
    EXPECT_FALSE(parseCommand("solve now").has_value());
}
