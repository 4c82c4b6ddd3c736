#pragma once

#include <git_summarizer/config/app_config.hpp>
#include <git_summarizer/core/result.hpp>

#include <string>
#include <string_view>

namespace git_summarizer {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. --help and --version only set flags;
// the caller decides what to print.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Usage text for --help.
std::string CliUsage();

// Merge two configs: values set in cli_overrides replace those in file_base.
// A template given on the command line (inline or as a file) replaces both
// template fields of the file.
AppConfig MergeConfigs(const AppConfig& file_base, const AppConfig& cli_overrides);

// Reject configurations that cannot be started.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Read commit_format_file (if set) into commit_format.
Result<AppConfig, Error> ResolveCommitFormatFile(AppConfig config);

} // namespace git_summarizer
