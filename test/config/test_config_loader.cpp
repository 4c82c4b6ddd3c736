#include <catch2/catch_test_macros.hpp>

#include <git_summarizer/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace git_summarizer;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive testdata from this file's path.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<AppConfig, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "git-summarizer");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("full_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    REQUIRE(config.repository.has_value());
    CHECK(*config.repository == "/srv/repos/project");
    REQUIRE(config.commit_format.has_value());
    CHECK(*config.commit_format == "<type>(<scope>): <subject>\n\n<body>");
    CHECK(config.log_level == LogLevel::Debug);
    CHECK(config.log_json);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/git-summarizer.log");
    CHECK(config.force_no_color);
    CHECK_FALSE(config.force_color);
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.repository == std::optional<std::string>("."));
    CHECK_FALSE(config.commit_format.has_value());
    CHECK_FALSE(config.log_level.has_value());
    CHECK_FALSE(config.log_json);
    CHECK_FALSE(config.log_file.has_value());
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: malformed YAML", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: unknown log level", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_level_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("chatty") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments", "[config][cli]") {
    auto result = ParseArgs({});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK_FALSE(config.repository.has_value());
    CHECK_FALSE(config.commit_format.has_value());
    CHECK_FALSE(config.log_level.has_value());
    CHECK_FALSE(config.show_help);
    CHECK_FALSE(config.show_version);
}

TEST_CASE("LoadFromCli: repository and template", "[config][cli]") {
    auto result = ParseArgs({"--repo", "/work/app", "--commit-format", "feat: X"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().repository == std::optional<std::string>("/work/app"));
    CHECK(result.Value().commit_format == std::optional<std::string>("feat: X"));
}

TEST_CASE("LoadFromCli: verbosity flags", "[config][cli]") {
    auto info = ParseArgs({"-v"});
    REQUIRE(info.IsOk());
    CHECK(info.Value().log_level == LogLevel::Info);

    auto debug = ParseArgs({"-vv"});
    REQUIRE(debug.IsOk());
    CHECK(debug.Value().log_level == LogLevel::Debug);

    auto named = ParseArgs({"--log-level", "error"});
    REQUIRE(named.IsOk());
    CHECK(named.Value().log_level == LogLevel::Error);
}

TEST_CASE("LoadFromCli: invalid log level", "[config][cli]") {
    auto result = ParseArgs({"--log-level", "loud"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: unknown flag is an error", "[config][cli]") {
    auto result = ParseArgs({"--frobnicate"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

TEST_CASE("LoadFromCli: help and version only set flags", "[config][cli]") {
    auto help = ParseArgs({"--help"});
    REQUIRE(help.IsOk());
    CHECK(help.Value().show_help);

    auto version = ParseArgs({"--version"});
    REQUIRE(version.IsOk());
    CHECK(version.Value().show_version);
}

TEST_CASE("CliUsage: lists the main options", "[config][cli]") {
    auto usage = CliUsage();
    CHECK(usage.find("--repo") != std::string::npos);
    CHECK(usage.find("--commit-format") != std::string::npos);
    CHECK(usage.find("--log-file") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides file values", "[config][merge]") {
    AppConfig file;
    file.repository = "/from/file";
    file.log_level = LogLevel::Debug;
    file.log_file = "/tmp/file.log";

    AppConfig cli;
    cli.repository = "/from/cli";

    auto merged = MergeConfigs(file, cli);
    CHECK(merged.repository == std::optional<std::string>("/from/cli"));
    CHECK(merged.log_level == LogLevel::Debug);
    CHECK(merged.log_file == std::optional<std::string>("/tmp/file.log"));
}

TEST_CASE("MergeConfigs: CLI template replaces file template file", "[config][merge]") {
    AppConfig file;
    file.commit_format_file = "template.txt";

    AppConfig cli;
    cli.commit_format = "inline";

    auto merged = MergeConfigs(file, cli);
    CHECK(merged.commit_format == std::optional<std::string>("inline"));
    CHECK_FALSE(merged.commit_format_file.has_value());
    CHECK(ValidateConfig(merged).IsOk());
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: empty repository path", "[config][validate]") {
    AppConfig config;
    config.repository = "";
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: both template sources", "[config][validate]") {
    AppConfig config;
    config.commit_format = "a";
    config.commit_format_file = "b.txt";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("mutually exclusive") != std::string::npos);
}

TEST_CASE("ValidateConfig: --color with --no-color", "[config][validate]") {
    AppConfig config;
    config.force_color = true;
    config.force_no_color = true;
    CHECK(ValidateConfig(config).IsErr());
}

// ===========================================================================
// ResolveCommitFormatFile
// ===========================================================================

TEST_CASE("ResolveCommitFormatFile: reads template and trims final newline",
          "[config][template]") {
    AppConfig config;
    config.commit_format_file = TestDataPath("commit_template.txt");

    auto result = ResolveCommitFormatFile(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().commit_format ==
          std::optional<std::string>("fix(<scope>): <subject>\n\nTicket: <TASK-number>"));
    CHECK_FALSE(result.Value().commit_format_file.has_value());
}

TEST_CASE("ResolveCommitFormatFile: no file is a no-op", "[config][template]") {
    AppConfig config;
    config.commit_format = "keep";
    auto result = ResolveCommitFormatFile(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().commit_format == std::optional<std::string>("keep"));
}

TEST_CASE("ResolveCommitFormatFile: missing file", "[config][template]") {
    AppConfig config;
    config.commit_format_file = "/nonexistent/template.txt";
    auto result = ResolveCommitFormatFile(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}
