#include <git_summarizer/config/config_loader.hpp>

#include <git_summarizer/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace git_summarizer {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, std::nullopt, ErrorCategory::Config};
}

Result<LogLevel, Error> ParseLevelOption(const std::string& name,
                                         const std::string& origin) {
    auto level = ParseLogLevel(name);
    if (!level) {
        return Result<LogLevel, Error>::Err(MakeConfigError(
            "Invalid " + origin + " '" + name +
            "' (expected debug, info, warn or error)"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

void DefineArguments(argparse::ArgumentParser& program, int& verbosity) {
    program.add_description(
        "MCP server over stdin/stdout exposing the staged git diff and "
        "commit creation as tools.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-r", "--repo")
        .help("Repository path (default: current directory)");
    program.add_argument("--commit-format")
        .help("Commit message template shown to the agent");
    program.add_argument("--commit-format-file")
        .help("Read the commit message template from a file");

    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Write diagnostics to a file instead of stderr");
    program.add_argument("--log-json")
        .help("JSON lines diagnostics")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Increase verbosity (-v info, -vv debug)")
        .action([&verbosity](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--color")
        .help("Force colored diagnostics")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored diagnostics")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-h", "--help")
        .help("Show this help and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (root["repository"]) {
            config.repository = root["repository"].as<std::string>();
        }
        if (root["commit_format"]) {
            config.commit_format = root["commit_format"].as<std::string>();
        }
        if (root["commit_format_file"]) {
            config.commit_format_file = root["commit_format_file"].as<std::string>();
        }

        if (const auto& log = root["log"]) {
            if (log["level"]) {
                auto level = ParseLevelOption(log["level"].as<std::string>(),
                                              "log.level");
                if (level.IsErr()) {
                    return Result<AppConfig, Error>::Err(std::move(level).Error());
                }
                config.log_level = level.Value();
            }
            if (log["json"]) {
                config.log_json = log["json"].as<bool>();
            }
            if (log["file"]) {
                config.log_file = log["file"].as<std::string>();
            }
            if (log["color"]) {
                if (log["color"].as<bool>()) {
                    config.force_color = true;
                } else {
                    config.force_no_color = true;
                }
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion,
                                     argparse::default_arguments::none);
    int verbosity = 0;
    DefineArguments(program, verbosity);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    config.show_help = program.get<bool>("--help");
    config.show_version = program.get<bool>("--version");

    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (auto val = program.present("--repo")) {
        config.repository = *val;
    }
    if (auto val = program.present("--commit-format")) {
        config.commit_format = *val;
    }
    if (auto val = program.present("--commit-format-file")) {
        config.commit_format_file = *val;
    }

    if (auto val = program.present("--log-level")) {
        auto level = ParseLevelOption(*val, "--log-level");
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(level).Error());
        }
        config.log_level = level.Value();
    }
    // -v/-vv win over --log-level when both are given.
    if (verbosity == 1) {
        config.log_level = LogLevel::Info;
    } else if (verbosity >= 2) {
        config.log_level = LogLevel::Debug;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.log_json = program.get<bool>("--log-json");
    config.force_color = program.get<bool>("--color");
    config.force_no_color = program.get<bool>("--no-color");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

std::string CliUsage() {
    argparse::ArgumentParser program(kServerName, kVersion,
                                     argparse::default_arguments::none);
    int verbosity = 0;
    DefineArguments(program, verbosity);
    return program.help().str();
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& file_base, const AppConfig& cli_overrides) {
    AppConfig merged = file_base;

    merged.config_path = cli_overrides.config_path;
    merged.show_help = cli_overrides.show_help;
    merged.show_version = cli_overrides.show_version;

    if (cli_overrides.repository) {
        merged.repository = cli_overrides.repository;
    }
    if (cli_overrides.commit_format || cli_overrides.commit_format_file) {
        merged.commit_format = cli_overrides.commit_format;
        merged.commit_format_file = cli_overrides.commit_format_file;
    }

    if (cli_overrides.log_level) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.log_json) {
        merged.log_json = true;
    }
    if (cli_overrides.log_file) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.force_color || cli_overrides.force_no_color) {
        merged.force_color = cli_overrides.force_color;
        merged.force_no_color = cli_overrides.force_no_color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.repository && config.repository->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Repository path must not be empty"));
    }
    if (config.commit_format && config.commit_format_file) {
        return Result<void, Error>::Err(MakeConfigError(
            "commit_format and commit_format_file are mutually exclusive"));
    }
    if (config.commit_format_file && config.commit_format_file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("commit_format_file must not be empty"));
    }
    if (config.log_file && config.log_file->empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("log file path must not be empty"));
    }
    if (config.force_color && config.force_no_color) {
        return Result<void, Error>::Err(
            MakeConfigError("--color and --no-color are mutually exclusive"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveCommitFormatFile
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveCommitFormatFile(AppConfig config) {
    if (!config.commit_format_file) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }

    std::ifstream in(*config.commit_format_file, std::ios::binary);
    if (!in) {
        return Result<AppConfig, Error>::Err(MakeConfigError(
            "Cannot read commit format file: " + *config.commit_format_file));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    auto text = ss.str();

    // Editors terminate the last line; the template itself does not end in one.
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }

    config.commit_format = std::move(text);
    config.commit_format_file.reset();
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace git_summarizer
