#include <git_summarizer/config/config_loader.hpp>
#include <git_summarizer/config/server_config.hpp>
#include <git_summarizer/core/log.hpp>
#include <git_summarizer/core/terminal.hpp>
#include <git_summarizer/core/version.hpp>
#include <git_summarizer/git/git_backend.hpp>
#include <git_summarizer/mcp/git_tools.hpp>
#include <git_summarizer/mcp/mcp_server.hpp>
#include <git_summarizer/mcp/tool_registry.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess  = 0;
constexpr int kExitInternal = 99;

constexpr const char* kLogComponent = "main";

// Sink for the resolved logging options. stdout is reserved for the protocol,
// so every variant writes to stderr or a file.
std::unique_ptr<git_summarizer::ILogSink> MakeSink(
    const git_summarizer::AppConfig& config) {
    using namespace git_summarizer;

    if (config.log_file) {
        auto file_sink = std::make_unique<FileSink>(*config.log_file,
                                                    config.log_json);
        if (file_sink->IsOpen()) {
            return file_sink;
        }
        std::cerr << "git-summarizer: cannot open log file '"
                  << *config.log_file << "', logging to stderr\n";
    }
    if (config.log_json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ColorConsoleSink>(
        ResolveLogColor(config.force_color, config.force_no_color));
}

void InitLogging(const git_summarizer::AppConfig& config) {
    git_summarizer::InitGlobalLogger(
        MakeSink(config),
        config.log_level.value_or(git_summarizer::LogLevel::Warn));
}

int RunServer(const git_summarizer::AppConfig& config) {
    using namespace git_summarizer;

    ServerConfig server_config(config.commit_format.value_or(kDefaultCommitFormat));

    LibGit2Backend backend(config.repository.value_or("."));
    auto workdir = backend.WorkingDirectory();
    if (workdir.IsOk()) {
        LogInfo(kLogComponent, "serving repository " + workdir.Value());
    } else {
        // Not fatal: every tool call reports the failure to the agent.
        LogWarn(kLogComponent, workdir.Error().ToString());
    }

    ToolRegistry registry;
    RegisterGitTools(registry, backend, server_config);

    McpServer server(registry, server_config);
    LogInfo(kLogComponent, std::string(kServerName) + " " + kVersion +
                               " listening on stdin");
    auto result = server.Run();
    if (result.IsErr()) {
        LogError(kLogComponent, result.Error().ToString());
        return result.Error().ExitCode();
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace git_summarizer;

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        std::cerr << cli_result.Error().ToString() << "\n"
                  << CliUsage();
        return cli_result.Error().ExitCode();
    }
    auto cli_config = std::move(cli_result).Value();

    if (cli_config.show_help) {
        std::cout << CliUsage();
        return kExitSuccess;
    }
    if (cli_config.show_version) {
        std::cout << kServerName << " " << kVersion << "\n";
        return kExitSuccess;
    }

    // CLI-only logging until the config file has been read.
    InitLogging(cli_config);

    AppConfig config = cli_config;
    if (cli_config.config_path) {
        auto yaml_result = LoadFromYaml(*cli_config.config_path);
        if (yaml_result.IsErr()) {
            LogError(kLogComponent, yaml_result.Error().ToString());
            return yaml_result.Error().ExitCode();
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
        InitLogging(config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        LogError(kLogComponent, valid.Error().ToString());
        return valid.Error().ExitCode();
    }

    auto resolved = ResolveCommitFormatFile(std::move(config));
    if (resolved.IsErr()) {
        LogError(kLogComponent, resolved.Error().ToString());
        return resolved.Error().ExitCode();
    }

    try {
        return RunServer(resolved.Value());
    } catch (const std::exception& e) {
        LogError(kLogComponent, std::string("unexpected exception: ") + e.what());
        return kExitInternal;
    }
}
