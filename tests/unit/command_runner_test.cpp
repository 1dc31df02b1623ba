#include <gtest/gtest.h>

#include "keyring/keyctl/CommandRunner.hpp"

#include <string>

TEST(CommandRunnerTest, ShellQuoteEscapesSingleQuotes)
{
    EXPECT_EQ(keyring::keyctl::shellQuote("keyctl"), "'keyctl'");
    EXPECT_EQ(keyring::keyctl::shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(keyring::keyctl::shellQuote(""), "''");
}

TEST(CommandRunnerTest, CapturesOutputAndExitCode)
{
    const auto result{ keyring::keyctl::runCommand({ "/bin/sh", "-c", "echo out; echo err 1>&2; exit 3" }) };

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 3);
    EXPECT_NE(result->output.find("out\n"), std::string::npos);
    EXPECT_NE(result->output.find("err\n"), std::string::npos);
}

TEST(CommandRunnerTest, ArgumentsAreNotReinterpretedByTheShell)
{
    const auto result{ keyring::keyctl::runCommand({ "/bin/echo", "$HOME; rm -rf /" }) };

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_EQ(result->output, "$HOME; rm -rf /\n");
}

TEST(CommandRunnerTest, MissingExecutableReportsNonZeroExit)
{
    const auto result{ keyring::keyctl::runCommand({ "/nonexistent/krc-keyctl" }) };

    ASSERT_TRUE(result.has_value());
    EXPECT_NE(result->exitCode, 0);
}

TEST(CommandRunnerTest, EmptyArgvIsRejected)
{
    EXPECT_FALSE(keyring::keyctl::runCommand({}).has_value());
}
