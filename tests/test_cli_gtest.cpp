// ==============================================================================
// test_cli_gtest.cpp - Тесты CLI модуля (GoogleTest)
// ==============================================================================

#include <sysguard/cli.hpp>

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace sysguard::cli::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

// Конвертация вектора строк в argc/argv
struct Args {
    std::vector<std::string> strings;
    std::vector<char*> ptrs;

    explicit Args(std::initializer_list<std::string> args) : strings(args) {
        for (auto& s : strings) {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(strings.size()); }

    char** argv() { return ptrs.data(); }
};

// ==============================================================================
// help / version
// ==============================================================================

TEST(CliTest, NoArgumentsShowsHelp) {
    Args args{"sysguard"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command));
}

TEST(CliTest, HelpFlags) {
    for (const char* flag : {"-h", "--help"}) {
        Args args{"sysguard", flag};
        ParseResult result = parse(args.argc(), args.argv());
        EXPECT_TRUE(result.ok) << flag;
        EXPECT_TRUE(std::holds_alternative<HelpCommand>(result.command)) << flag;
    }
}

TEST(CliTest, HelpSubcommandNamesCommand) {
    Args args{"sysguard", "help", "load"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& help = std::get<HelpCommand>(result.command);
    ASSERT_TRUE(help.command.has_value());
    EXPECT_EQ(*help.command, "load");
}

TEST(CliTest, HelpAfterSubcommand) {
    Args args{"sysguard", "lint", "--help"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(std::get<HelpCommand>(result.command).command, std::optional<std::string>("lint"));
}

TEST(CliTest, VersionFlags) {
    for (const char* flag : {"-V", "--version"}) {
        Args args{"sysguard", flag};
        ParseResult result = parse(args.argc(), args.argv());
        EXPECT_TRUE(result.ok) << flag;
        EXPECT_TRUE(std::holds_alternative<VersionCommand>(result.command)) << flag;
    }
}

TEST(CliTest, RenderVersion) {
    EXPECT_EQ(render_version(), "sysguard 0.1.0\n");
}

TEST(CliTest, RenderHelpListsCommands) {
    std::string help = render_help();
    EXPECT_EQ(help.rfind(ABOUT, 0), 0u);
    EXPECT_NE(help.find("Usage: sysguard [OPTIONS] <COMMAND>"), std::string::npos);
    EXPECT_NE(help.find("  lint "), std::string::npos);
    EXPECT_NE(help.find("  load "), std::string::npos);
    EXPECT_NE(help.find("--log-file <FILE>"), std::string::npos);

    EXPECT_NE(render_help("load").find("-j, --json"), std::string::npos);
    EXPECT_NE(render_help("lint").find("Usage: sysguard lint <PATH>..."), std::string::npos);
    // Неизвестная команда: общий help
    EXPECT_EQ(render_help("nope"), help);
}

// ==============================================================================
// Глобальные опции
// ==============================================================================

TEST(CliTest, VerboseIsCounted) {
    Args args{"sysguard", "-v", "-vv", "lint", "rules.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.global.verbose, 3);
    EXPECT_FALSE(result.global.quiet);
}

TEST(CliTest, QuietAndLogFile) {
    Args args{"sysguard", "-q", "--log-file", "sysguard.log", "lint", "rules.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.global.quiet);
    ASSERT_TRUE(result.global.log_file.has_value());
    EXPECT_EQ(result.global.log_file->filename().string(), "sysguard.log");
}

TEST(CliTest, LogFileWithEquals) {
    Args args{"sysguard", "--log-file=diag.log", "lint", "rules.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(result.global.log_file.has_value());
    EXPECT_EQ(result.global.log_file->string(), "diag.log");
}

TEST(CliTest, LogFileWithoutValueIsUsageError) {
    Args args{"sysguard", "--log-file"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("--log-file <FILE>"), std::string::npos);
}

// ==============================================================================
// lint / load
// ==============================================================================

TEST(CliTest, LintCollectsPaths) {
    Args args{"sysguard", "lint", "a.yml", "b.yaml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& lint = std::get<LintCommand>(result.command);
    ASSERT_EQ(lint.paths.size(), 2u);
    EXPECT_EQ(lint.paths[0].string(), "a.yml");
    EXPECT_EQ(lint.paths[1].string(), "b.yaml");
}

TEST(CliTest, LoadOptions) {
    Args args{"sysguard", "load", "--json", "-o", "active.json", "-v", "a.yml", "b.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& load = std::get<LoadCommand>(result.command);
    EXPECT_TRUE(load.json);
    ASSERT_TRUE(load.output.has_value());
    EXPECT_EQ(load.output->string(), "active.json");
    EXPECT_EQ(load.paths.size(), 2u);
    EXPECT_EQ(result.global.verbose, 1);
}

TEST(CliTest, LoadDefaults) {
    Args args{"sysguard", "load", "a.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    ASSERT_TRUE(result.ok);
    const auto& load = std::get<LoadCommand>(result.command);
    EXPECT_FALSE(load.json);
    EXPECT_FALSE(load.output.has_value());
}

// ==============================================================================
// Ошибки использования (exit code 2)
// ==============================================================================

TEST(CliTest, MissingPaths) {
    for (const char* cmd : {"lint", "load"}) {
        Args args{"sysguard", cmd};
        ParseResult result = parse(args.argc(), args.argv());

        EXPECT_FALSE(result.ok) << cmd;
        EXPECT_EQ(result.diagnostic.exit_code, 2) << cmd;
        EXPECT_NE(result.diagnostic.stderr_message.find("<PATH>..."), std::string::npos);
        EXPECT_NE(result.diagnostic.stderr_message.find(std::string("Usage: sysguard ") + cmd),
                  std::string::npos);
    }
}

TEST(CliTest, UnknownSubcommand) {
    Args args{"sysguard", "hunt", "rules.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_EQ(result.diagnostic.stderr_message,
              "error: unrecognized subcommand 'hunt'\n\nFor more information, try '--help'.\n");
}

TEST(CliTest, UnknownFlag) {
    Args args{"sysguard", "load", "--fast", "a.yml"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
    EXPECT_NE(result.diagnostic.stderr_message.find("unexpected argument '--fast' found"),
              std::string::npos);
}

TEST(CliTest, OutputWithoutValue) {
    Args args{"sysguard", "load", "a.yml", "-o"};

    ParseResult result = parse(args.argc(), args.argv());

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.diagnostic.exit_code, 2);
}

}  // namespace sysguard::cli::test
