#include <catch2/catch_test_macros.hpp>

#include <skills_mcp/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace skills_mcp;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the testdata path from this
// file's location in the source tree.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.name == "skills-test");
    CHECK(config.server.version == "9.9.9");
    CHECK(config.server.protocol_version == "2024-11-05");

    REQUIRE(config.enabled_tools.size() == 2);
    CHECK(config.enabled_tools[0] == "add");
    CHECK(config.enabled_tools[1] == "echo");

    CHECK(config.log_level == LogLevel::Debug);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/skills-mcp-test.log");
    CHECK(config.json_logs);
    REQUIRE(config.color.has_value());
    CHECK_FALSE(*config.color);

    REQUIRE(config.log_seed.has_value());
    CHECK(*config.log_seed == 42u);
    CHECK(config.max_log_entries == 50);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.name == "minimal");
    CHECK(config.server.version == kVersion);
    CHECK(config.server.protocol_version == "2024-11-05");
    CHECK(config.enabled_tools.empty());
    CHECK(config.log_level == LogLevel::Warn);
    CHECK_FALSE(config.log_file.has_value());
    CHECK_FALSE(config.json_logs);
    CHECK_FALSE(config.color.has_value());
    CHECK_FALSE(config.log_seed.has_value());
    CHECK(config.max_log_entries == 1000);
}

TEST_CASE("LoadFromYaml: missing file", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: unknown log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_log_level.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("chatty") != std::string::npos);
}

TEST_CASE("LoadFromYaml: tools must be a list", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("tools_not_a_list.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("'tools'") != std::string::npos);
}

TEST_CASE("LoadFromYaml: unknown tool loads but fails validation", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("unknown_tool.yaml"));
    REQUIRE(result.IsOk());

    auto valid = ValidateConfig(result.Value());
    REQUIRE(valid.IsErr());
    CHECK(valid.Error().message == "Unknown tool in config: spreadsheet");
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no flags leaves everything unset", "[config][cli]") {
    const char* argv[] = {"skills-mcp"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();

    CHECK_FALSE(cli.config_path.has_value());
    CHECK_FALSE(cli.server_name.has_value());
    CHECK_FALSE(cli.enabled_tools.has_value());
    CHECK_FALSE(cli.log_level.has_value());
    CHECK_FALSE(cli.log_file.has_value());
    CHECK_FALSE(cli.json_logs);
    CHECK_FALSE(cli.color.has_value());
    CHECK_FALSE(cli.log_seed.has_value());
    CHECK_FALSE(cli.max_log_entries.has_value());
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    const char* argv[] = {
        "skills-mcp",
        "--config", "/etc/skills.yaml",
        "--name", "from-cli",
        "--tools", "echo, calculate",
        "--log-level", "error",
        "--log-file", "/tmp/cli.log",
        "--json-logs",
        "--no-color",
        "--seed", "7",
        "--max-log-entries", "20",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);
    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();

    CHECK(*cli.config_path == "/etc/skills.yaml");
    CHECK(*cli.server_name == "from-cli");
    REQUIRE(cli.enabled_tools.has_value());
    CHECK(*cli.enabled_tools == std::vector<std::string>{"echo", "calculate"});
    CHECK(*cli.log_level == LogLevel::Error);
    CHECK(*cli.log_file == "/tmp/cli.log");
    CHECK(cli.json_logs);
    CHECK(*cli.color == false);
    CHECK(*cli.log_seed == 7u);
    CHECK(*cli.max_log_entries == 20);
}

TEST_CASE("LoadFromCli: verbosity shorthands", "[config][cli]") {
    SECTION("--verbose is info") {
        const char* argv[] = {"skills-mcp", "--verbose"};
        auto result = LoadFromCli(2, argv);
        REQUIRE(result.IsOk());
        CHECK(*result.Value().log_level == LogLevel::Info);
    }

    SECTION("--debug wins over --verbose") {
        const char* argv[] = {"skills-mcp", "--verbose", "--debug"};
        auto result = LoadFromCli(3, argv);
        REQUIRE(result.IsOk());
        CHECK(*result.Value().log_level == LogLevel::Debug);
    }

    SECTION("--log-level wins over shorthands") {
        const char* argv[] = {"skills-mcp", "--debug", "--log-level", "warn"};
        auto result = LoadFromCli(4, argv);
        REQUIRE(result.IsOk());
        CHECK(*result.Value().log_level == LogLevel::Warn);
    }
}

TEST_CASE("LoadFromCli: --color forces color", "[config][cli]") {
    const char* argv[] = {"skills-mcp", "--color"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().color.has_value());
    CHECK(*result.Value().color);
}

TEST_CASE("LoadFromCli: rejects bad input", "[config][cli]") {
    SECTION("unknown log level") {
        const char* argv[] = {"skills-mcp", "--log-level", "loud"};
        auto result = LoadFromCli(3, argv);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("--log-level") != std::string::npos);
    }

    SECTION("negative seed") {
        const char* argv[] = {"skills-mcp", "--seed", "-1"};
        auto result = LoadFromCli(3, argv);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }

    SECTION("seed too large") {
        const char* argv[] = {"skills-mcp", "--seed", "4294967296"};
        auto result = LoadFromCli(3, argv);
        REQUIRE(result.IsErr());
    }

    SECTION("unknown flag") {
        const char* argv[] = {"skills-mcp", "--frobnicate"};
        auto result = LoadFromCli(2, argv);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
    }
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML", "[config][merge]") {
    AppConfig base;
    base.server.name = "yaml-name";
    base.enabled_tools = {"echo"};
    base.log_level = LogLevel::Debug;
    base.color = true;
    base.max_log_entries = 10;

    CliOptions cli;
    cli.server_name = "cli-name";
    cli.enabled_tools = std::vector<std::string>{"add", "calculate"};
    cli.color = false;
    cli.log_seed = 3u;

    auto merged = MergeConfigs(base, cli);
    CHECK(merged.server.name == "cli-name");
    CHECK(merged.enabled_tools == std::vector<std::string>{"add", "calculate"});
    CHECK(merged.log_level == LogLevel::Debug);
    CHECK(*merged.color == false);
    CHECK(*merged.log_seed == 3u);
    CHECK(merged.max_log_entries == 10);
}

TEST_CASE("MergeConfigs: empty CLI keeps base", "[config][merge]") {
    AppConfig base;
    base.server.version = "2.0.0";
    base.json_logs = true;
    base.log_file = "/var/log/skills.log";

    auto merged = MergeConfigs(base, CliOptions{});
    CHECK(merged.server.version == "2.0.0");
    CHECK(merged.json_logs);
    CHECK(*merged.log_file == "/var/log/skills.log");
    CHECK(merged.enabled_tools.empty());
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad values", "[config][validate]") {
    AppConfig config;

    SECTION("empty server name") {
        config.server.name.clear();
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Server name must not be empty");
    }

    SECTION("empty protocol version") {
        config.server.protocol_version.clear();
        CHECK(ValidateConfig(config).IsErr());
    }

    SECTION("max entries below one") {
        config.max_log_entries = 0;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "max_entries must be at least 1, got 0");
    }

    SECTION("duplicate tool") {
        config.enabled_tools = {"echo", "add", "echo"};
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Tool listed twice in config: echo");
    }
}

TEST_CASE("ValidateConfig: subset of built-in tools", "[config][validate]") {
    AppConfig config;
    config.enabled_tools = {"generate_logs", "calculate"};
    CHECK(ValidateConfig(config).IsOk());
}

// ===========================================================================
// SplitToolList
// ===========================================================================

TEST_CASE("SplitToolList: trims and drops empty items", "[config]") {
    CHECK(SplitToolList("echo,add") == std::vector<std::string>{"echo", "add"});
    CHECK(SplitToolList(" echo , , add ,") == std::vector<std::string>{"echo", "add"});
    CHECK(SplitToolList("").empty());
    CHECK(SplitToolList(" , ").empty());
    CHECK(SplitToolList("calculate") == std::vector<std::string>{"calculate"});
}

// ===========================================================================
// BuiltinToolNames
// ===========================================================================

TEST_CASE("BuiltinToolNames: default registration order", "[config]") {
    CHECK(BuiltinToolNames() ==
          std::vector<std::string>{"echo", "add", "calculate", "generate_logs"});

    AppConfig config;
    config.enabled_tools = BuiltinToolNames();
    CHECK(ValidateConfig(config).IsOk());
}
