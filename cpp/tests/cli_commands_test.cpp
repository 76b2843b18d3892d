#include <array>

#include <gtest/gtest.h>

#include "snap/cli/commands.hpp"

namespace {

const std::array<snap::cli::CommandSpec, 4> kSpecs = {{
    {snap::cli::CommandId::Help, "help"},
    {snap::cli::CommandId::Submit, "submit"},
    {snap::cli::CommandId::Access, "access"},
    {snap::cli::CommandId::Drain, "drain"},
}};

} // namespace

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const char* argv[] = {"access", "00112233445566778899aabbccddeeff", "--answer", "blue"};
    const snap::cli::CliArgs args{argv, 4};

    snap::cli::CommandInvocation out{};
    snap::cli::u32 consumed = 0;
    const snap::core::Status s = snap::cli::parse_command(args, kSpecs.data(), kSpecs.size(), &out, &consumed);
    ASSERT_EQ(s.code, snap::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, snap::cli::CommandId::Access);
    ASSERT_EQ(out.args.argc, 3u);
    EXPECT_STREQ(out.args.argv[0], "00112233445566778899aabbccddeeff");
}

TEST(CliCommands, CommandWithoutArguments) {
    const char* argv[] = {"drain"};
    snap::cli::CommandInvocation out{};
    snap::cli::u32 consumed = 0;
    ASSERT_EQ(snap::cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              snap::core::StatusCode::Ok);
    EXPECT_EQ(out.id, snap::cli::CommandId::Drain);
    EXPECT_EQ(out.args.argc, 0u);
}

TEST(CliCommands, NotFoundOnUnknownCommand) {
    const char* argv[] = {"reveal"};
    snap::cli::CommandInvocation out{};
    snap::cli::u32 consumed = 0;
    const snap::core::Status s = snap::cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed);
    EXPECT_EQ(s.code, snap::core::StatusCode::NotFound);
    EXPECT_EQ(s.domain, snap::core::StatusDomain::Cli);
    EXPECT_EQ(consumed, 0u);
}

TEST(CliCommands, InvalidOnEmptyOrOption) {
    snap::cli::CommandInvocation out{};
    snap::cli::u32 consumed = 0;
    EXPECT_EQ(snap::cli::parse_command({nullptr, 0}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              snap::core::StatusCode::Invalid);

    const char* argv[] = {"--submit"};
    EXPECT_EQ(snap::cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              snap::core::StatusCode::Invalid);
    EXPECT_EQ(snap::cli::parse_command({argv, 1}, kSpecs.data(), kSpecs.size(), nullptr, &consumed).code,
              snap::core::StatusCode::Invalid);
}
